#include "log.h"
#include "debug/exceptions.h"

void eig::setLevel(spdlog::level::level_enum level) { eig::log->set_level(level); }
void eig::setLevel(size_t level) {
    if(level > 6) throw except::invalid_argument("eig::setLevel: expected a level in [0-6]. Got: {}", level);
    eig::log->set_level(static_cast<spdlog::level::level_enum>(level));
}
void eig::setTimeStamp(std::string_view stamp) { eig::log->set_pattern(std::string(stamp)); }
