#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <atomic>
#include <mutex>
#include <cctype>

namespace devroute {

// Logs router storage events as single sanitized lines.
class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };
    
    enum class Event {
        REGISTRATION_STORED,
        REGISTRATION_REJECTED,
        ENTRY_EXPIRED,
        ENTRY_CORRUPTED,
        BACKEND_FAILURE,
        PACKET_DROPPED,
        CONFIG
    };

    // Events below this level are discarded.
    static void set_min_level(Level level) {
        min_level() = level;
    }

    static bool enabled(Level level) {
        return static_cast<int>(level) >= static_cast<int>(min_level().load());
    }
    
    /**
     * Records a storage event.
     * @param level Severity level of the event.
     * @param event The specific type of event.
     * @param device Hex device EUI the event concerns, empty for none.
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, Event event, const std::string& device,
                    const std::string& message = "") {
        if (!enabled(level)) return;

        std::string line = format(level, event, device, message);

        static std::mutex output_mutex;
        std::lock_guard<std::mutex> lock(output_mutex);
        // Log to appropriate destination based on severity
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
    }

    // Renders one log line without the trailing newline.
    static std::string format(Level level, Event event, const std::string& device,
                              const std::string& message) {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        
        struct tm gmt;
        gmtime_r(&time_t, &gmt);
        
        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "]";
        
        if (!device.empty()) {
            ss << " dev=" << sanitize_log_message(device);
        }
        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }
        return ss.str();
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }
    
private:
    static std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }
    
    static std::string event_to_string(Event event) {
        switch (event) {
            case Event::REGISTRATION_STORED: return "REG_STORED";
            case Event::REGISTRATION_REJECTED: return "REG_REJECTED";
            case Event::ENTRY_EXPIRED: return "EXPIRED";
            case Event::ENTRY_CORRUPTED: return "CORRUPTED";
            case Event::BACKEND_FAILURE: return "BACKEND";
            case Event::PACKET_DROPPED: return "DROPPED";
            case Event::CONFIG: return "CONFIG";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}
