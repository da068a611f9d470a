#pragma once
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <stdexcept>

namespace Kapital {

// Tagged key/value log lines to stdout, mirrored to a file when one is open.
class RunLog {
public:
    explicit RunLog(const std::string& tag) : tag_(tag) {}

    RunLog(const std::string& tag, const std::string& path) : tag_(tag) { open(path); }

    void open(const std::string& path) {
        file_.open(path, std::ios::out | std::ios::trunc);
        if (!file_.is_open()) {
            throw std::runtime_error("Could not open log file: " + path);
        }
    }

    void close() {
        if (file_.is_open()) file_.close();
    }

    template <typename T>
    void log(const std::string& key, const T& value) {
        std::ostringstream line;
        line << std::boolalpha << std::setprecision(10) << key << ": " << value;
        write(line.str());
    }

private:
    void write(const std::string& text) {
        std::cout << "[Kapital::" << tag_ << "] " << text << std::endl;
        if (file_.is_open()) file_ << text << "\n";
    }

    std::string tag_ = "Run";
    std::ofstream file_;
};

} // namespace Kapital
