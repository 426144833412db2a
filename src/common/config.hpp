#pragma once

#include "wide_int.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sbr {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%f] [%l] %v";
};

struct CodecConfig {
    bool case_sensitive = false;
    std::string style = "G";  // G, F, D or X
};

struct MemberDeclaration {
    std::string name;
    WideInt value = 0;
};

// An enum supplied as data rather than as a C++ type.
struct EnumDeclaration {
    std::string type_id;
    uint32_t width = 32;
    bool is_signed = true;
    std::vector<MemberDeclaration> members;
};

// Values and texts to format/parse against a registered enum.
struct SampleQuery {
    std::string type_id;
    std::vector<WideInt> values;
    std::vector<std::string> texts;
};

struct Config {
    LoggingConfig logging;
    CodecConfig codec;
    std::vector<EnumDeclaration> enums;
    std::vector<SampleQuery> samples;

    static Config load_from_file(const std::string& path);
    static Config load_from_string(std::string_view text);
    static Config default_config();
};

} // namespace sbr
