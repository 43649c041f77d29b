#include "loader.h"
#include <array>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

Loader::Loader(const fs::path &cfg_file) {
    file_exists = fs::exists(cfg_file);
    file_path   = fs::absolute(cfg_file);
    if(not file_exists) return;
    file_path = fs::canonical(cfg_file);
}

void Loader::load() {
    // Extract the parameters and generate a key-value map
    if(not file_exists) throw except::file_error("Can't load config file [{}]: it does not exist", file_path.string());
    if(not param_map.empty()) return;

    std::istringstream file_stream(get_config_file_as_string());
    std::string        line;
    while(std::getline(file_stream, line)) {
        if(is_parameterline(line)) {
            line                  = remove_leading_spaces(line);
            auto comment_position = find_comment_character(line);
            if(comment_position == 0) continue;
            std::string        param_key;
            std::string        param_val;
            std::istringstream linestream(line);
            std::getline(linestream, param_key, '=');
            std::getline(linestream, param_val, '\n');
            param_val = param_val.substr(0, find_comment_character(param_val));
            param_key = remove_spaces(param_key);
            param_val = remove_spaces(param_val);
            std::transform(param_key.begin(), param_key.end(), param_key.begin(), to_lower);
            param_map[param_key] = param_val;
        }
    }
}

std::string Loader::get_config_file_as_string() {
    // Load the file into memory
    if(file_path.extension() != ".cfg")
        throw except::file_error("Tried to read config from file with unknown extension [{}], expected .cfg", file_path.filename().string());
    std::ifstream file(file_path);
    if(not file.is_open()) throw except::file_error("Could not open file [{}]", file_path.string());
    return std::string((std::istreambuf_iterator<char>(file)), (std::istreambuf_iterator<char>()));
}

char Loader::to_lower(unsigned char c) { return static_cast<char>(std::tolower(c)); }

std::string Loader::remove_spaces(std::string str) {
    str.erase(std::remove_if(str.begin(), str.end(), [](unsigned char c) { return std::isspace(c) != 0; }), str.end());
    return str;
}

std::string Loader::remove_leading_spaces(std::string str, std::string_view whitespace) {
    const auto strBegin = str.find_first_not_of(whitespace);
    if(strBegin == std::string::npos) return ""; // no content
    const auto strEnd   = str.find_last_not_of(whitespace);
    const auto strRange = strEnd - strBegin + 1;
    return str.substr(strBegin, strRange);
}

bool Loader::is_parameterline(std::string_view str) { return str.find('=') != std::string_view::npos; }

std::string_view::size_type Loader::find_comment_character(std::string_view str) {
    constexpr std::array<std::string_view, 3> comment_symbols = {"//", "/*", "#"};
    auto                                      pos             = std::string_view::npos;
    for(auto &sym : comment_symbols) pos = std::min(pos, str.find(sym));
    return pos;
}
