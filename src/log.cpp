#include "log.h"

#include <atomic>
#include <iostream>
#include <mutex>

namespace sniprun {
namespace log {

namespace {

std::mutex output_mutex;
std::atomic<bool> quiet_mode{false};

void write_line(std::ostream& out, const char* level, const std::string& tag,
                const std::string& message) {
    std::lock_guard<std::mutex> lock(output_mutex);
    out << level << "[" << tag << "] " << message << std::endl;
}

} // namespace

void info(const std::string& tag, const std::string& message) {
    if (quiet_mode) return;
    write_line(std::cout, "", tag, message);
}

void warn(const std::string& tag, const std::string& message) {
    write_line(std::cerr, "WARN ", tag, message);
}

void error(const std::string& tag, const std::string& message) {
    write_line(std::cerr, "ERROR ", tag, message);
}

void alert(const std::string& tag, const std::string& message) {
    write_line(std::cerr, "[ALERT] ", tag, message);
}

void set_quiet(bool quiet) {
    quiet_mode = quiet;
}

} // namespace log
} // namespace sniprun
