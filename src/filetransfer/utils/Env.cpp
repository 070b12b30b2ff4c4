#include "Env.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

const Env::ValueEntry& Env::ValueEntry::operator=(
    const std::string_view value) const {
    setenv(_key.c_str(), std::string(value).c_str(), 1);
    return *this;
}

void Env::ValueEntry::clear() const { unsetenv(_key.c_str()); }

std::string Env::ValueEntry::get() const {
    const char* value = getenv(_key.c_str());
    if (value == nullptr) {
        throw std::invalid_argument("env variable not set: " + _key);
    }
    return value;
}

bool Env::ValueEntry::has() const { return getenv(_key.c_str()) != nullptr; }
