//	Copyright (c) 2021, SBEL GPU Development Team
//	Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#ifndef DDAP_LOGGER_HPP
#define DDAP_LOGGER_HPP

#include <cstdio>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <memory>

namespace ddap {

// Verbosity
typedef int verbosity_t;
const verbosity_t VERBOSITY_QUIET = 0;
const verbosity_t VERBOSITY_ERROR = 1;
const verbosity_t VERBOSITY_WARNING = 2;
const verbosity_t VERBOSITY_INFO = 3;
const verbosity_t VERBOSITY_STEP = 4;
const verbosity_t VERBOSITY_DEBUG = 5;

// -----------------------------
// Logging types and structure
// -----------------------------

enum class MessageType { Info, Warning, Error, Status };

struct LogMessage {
    MessageType type;
    std::string source;
    std::string message;
    std::string file;
    int line;
    std::string identifier;
};

// -----------------------------
// Logger and exception class (thread-safe, singleton)
// -----------------------------

/// Thrown for configuration errors: invalid shape parameters, volume fractions, strategy names and the like.
class DDAPException : public std::runtime_error {
  public:
    DDAPException(const std::string& msg) : std::runtime_error(msg) {}
};

/// Process-wide message store. Placement, validation and discretization all report through it.
class Logger {
  public:
    static Logger& GetInstance() {
        static Logger instance;
        return instance;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void SetVerbosity(verbosity_t level) {
        std::lock_guard<std::mutex> lock(mutex_);
        verbosity = level;
    }

    /// Redirect the immediate echo of messages (std::cout by default).
    void SetOutputStream(std::ostream& os) {
        std::lock_guard<std::mutex> lock(mutex_);
        out = &os;
    }

    void Log(MessageType type, const std::string& source, const std::string& msg, const std::string& file, int line) {
        std::lock_guard<std::mutex> lock(mutex_);
        LogMessage Log{type, source, msg, file, line};
        logs.push_back(Log);

        if (should_print_immediately(type)) {
            *out << format(Log) << std::endl;
        }
    }

    // snprintf version of logging
    template <typename... Args>
    std::string Logf(MessageType type, const char* func, const char* file, int line, const char* fmt, Args&&... args) {
        constexpr size_t BUF_SIZE = 2048;
        char buffer[BUF_SIZE];
        std::snprintf(buffer, BUF_SIZE, fmt, std::forward<Args>(args)...);
        std::string message(buffer);
        Log(type, func, message, file, line);
        return message;
    }

    // std::string version of logging
    std::string Logf(MessageType type, const char* func, const char* file, int line, const std::string& message) {
        Log(type, func, message, file, line);
        return message;
    }

    void LogStatus(const std::string& identifier,
                   const std::string& func,
                   const std::string& msg,
                   const std::string& file,
                   int line) {
        std::lock_guard<std::mutex> lock(mutex_);

        LogMessage Log{MessageType::Status, func, msg, file, line, identifier};
        status_messages[identifier] = Log;

        if (should_print_immediately(MessageType::Status)) {
            *out << format(Log) << std::endl;
        }
    }

    void PrintWarningsAndErrors(std::ostream& os = std::cout) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& Log : logs) {
            if (Log.type == MessageType::Warning || Log.type == MessageType::Error) {
                os << format(Log) << std::endl;
            }
        }
    }

    void PrintStatusMessages(std::ostream& os = std::cout) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& pair : status_messages) {
            os << format(pair.second) << std::endl;
        }
    }

    /// Copy out all recorded messages of one type, oldest first.
    std::vector<LogMessage> GetMessages(MessageType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<LogMessage> res;
        for (const auto& Log : logs) {
            if (Log.type == type)
                res.push_back(Log);
        }
        return res;
    }

    bool HasErrors() const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& Log : logs) {
            if (Log.type == MessageType::Error)
                return true;
        }
        return false;
    }

    bool HasWarnings() const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& Log : logs) {
            if (Log.type == MessageType::Warning)
                return true;
        }
        return false;
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        logs.clear();
        status_messages.clear();
    }

    verbosity_t GetVerbosity() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return verbosity;
    }

  private:
    Logger() : verbosity(VERBOSITY_WARNING), out(&std::cout) {}
    ~Logger() {}

    bool should_print_immediately(MessageType type) const {
        switch (type) {
            case MessageType::Error:
                return verbosity >= VERBOSITY_ERROR;
            case MessageType::Warning:
                return verbosity >= VERBOSITY_WARNING;
            case MessageType::Info:
                return verbosity >= VERBOSITY_INFO;
            case MessageType::Status:
                return verbosity >= VERBOSITY_STEP;
            default:
                return false;
        }
    }

    std::string format(const LogMessage& Log) const {
        std::ostringstream oss;
        switch (Log.type) {
            case MessageType::Error:
                oss << "[ERROR]   ";
                break;
            case MessageType::Warning:
                oss << "[WARNING] ";
                break;
            case MessageType::Info:
                oss << "[INFO]    ";
                break;
            case MessageType::Status:
                oss << "[STATUS]  ";
                break;
        }
        oss << Log.source << ": " << Log.message;
        if (Log.type != MessageType::Info)
            oss << " (" << Log.file << ":" << Log.line << ")";
        if (!Log.identifier.empty() && Log.type == MessageType::Status)
            oss << " [id: " << Log.identifier << "]";
        return oss.str();
    }

    mutable std::mutex mutex_;
    std::vector<LogMessage> logs;
    std::unordered_map<std::string, LogMessage> status_messages;
    verbosity_t verbosity;
    std::ostream* out;
};

// -----------------------------
// Logging utils for easy usage
// -----------------------------

#define DDAP_GET_VERBOSITY() ::ddap::Logger::GetInstance().GetVerbosity()

#define DDAP_ERROR(...)                                                                                 \
    throw ::ddap::DDAPException(::ddap::Logger::GetInstance().Logf(::ddap::MessageType::Error, __func__, \
                                                                   __FILE__, __LINE__, __VA_ARGS__))

#define DDAP_WARNING(...) \
    ::ddap::Logger::GetInstance().Logf(::ddap::MessageType::Warning, __func__, __FILE__, __LINE__, __VA_ARGS__)

#define DDAP_INFO(...) \
    ::ddap::Logger::GetInstance().Logf(::ddap::MessageType::Info, __func__, __FILE__, __LINE__, __VA_ARGS__)

#define DDAP_STATUS(identifier, ...)                                                               \
    do {                                                                                           \
        constexpr size_t BUF_SIZE = 2048;                                                          \
        char buffer[BUF_SIZE];                                                                     \
        std::snprintf(buffer, BUF_SIZE, __VA_ARGS__);                                              \
        ::ddap::Logger::GetInstance().LogStatus(identifier, __func__, buffer, __FILE__, __LINE__); \
    } while (0)

}  // namespace ddap

#endif
