//
// Created by cv2 on 11/2/25.
//

#pragma once

#include <iostream>
#include <string>
#include <source_location>

namespace hy::log {

    // Process-wide switch for debug() output, set from the loaded Config.
    inline bool& verbose() {
        static bool enabled = false;
        return enabled;
    }

    // "hy :: [LV] :: message", level tag colored
    inline void print(const std::string& level, const std::string& color_code, const std::string& msg) {
        std::cout << color_code << "hy :: [" << level << "] :: " << "\033[0m" << msg << std::endl;
    }

    inline void ok(const std::string& msg) {
        print("OK", "\033[1;32m", msg); // Bold Green
    }

    inline void error(const std::string& msg, const std::source_location& loc = std::source_location::current()) {
        std::string full_msg = msg + " (at " + loc.file_name() + ":" + std::to_string(loc.line()) + ")";
        print("ER", "\033[1;31m", full_msg); // Bold Red
    }

    inline void info(const std::string& msg) {
        print("..", "\033[1;34m", msg); // Bold Blue
    }

    inline void warn(const std::string& msg) {
        print("WR", "\033[1;33m", msg); // Bold Yellow
    }

    inline void debug(const std::string& msg) {
        if (verbose()) {
            print("DB", "\033[0;37m", msg);
        }
    }

    // Prints a progress message without a newline, and flushes the output.
    inline void progress(const std::string& msg) {
        // \r: Carriage return (moves cursor to the beginning of the line)
        // \033[K: Erase from the cursor to the end of the line
        std::cout << "\r\033[K"
                  << "\033[1;34m" << "[..] > " << "\033[0m" // Blue header
                  << msg << std::flush;
    }

    // Closes a line started by progress() with a green "[OK]".
    inline void progress_ok() {
        std::cout << " [" << "\033[1;32m" << "  OK  " << "\033[0m" << "]" << std::endl;
    }

} // namespace hy::log
