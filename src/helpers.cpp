#include "homestead/helpers.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace homestead {
namespace helpers {

std::string format_cents(int64_t cents) {
    std::ostringstream out;
    if (cents < 0) {
        out << '-';
        cents = -cents;
    }
    out << '$' << cents / 100 << '.' << std::setw(2) << std::setfill('0') << cents % 100;
    return out.str();
}

google::protobuf::Timestamp now() {
    auto time_point = std::chrono::system_clock::now();
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

} // namespace helpers
} // namespace homestead
