#include "loader.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

bool read_file_binary(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream f(path, std::ios::binary);
    if(!f) {
        std::cerr << "[loadbin] cannot open '" << path << "'\n";
        return false;
    }
    f.seekg(0, std::ios::end);
    std::streamsize n = f.tellg();
    if(n < 0) return false;
    f.seekg(0, std::ios::beg);
    out.resize((size_t)n);
    if(n > 0) f.read(reinterpret_cast<char*>(out.data()), n);
    return (bool)f;
}

static bool is_hex(char c) {
    return (c>='0'&&c<='9')||(c>='a'&&c<='f')||(c>='A'&&c<='F');
}

bool read_file_hexbytes(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream f(path);
    if(!f) {
        std::cerr << "[loadhex] cannot open '" << path << "'\n";
        return false;
    }
    out.clear();
    std::string line;
    size_t lineno = 0;
    while (std::getline(f, line)) {
        ++lineno;
        // strip comment markers: # ... ; ... // ...
        auto cut = line.find_first_of("#;");
        if (cut != std::string::npos) line.resize(cut);
        cut = line.find("//");
        if (cut != std::string::npos) line.resize(cut);

        std::istringstream iss(line);
        std::string tok;
        while (iss >> tok) {
            tok.erase(std::remove(tok.begin(), tok.end(), ','), tok.end());
            tok.erase(std::remove(tok.begin(), tok.end(), '_'), tok.end());
            if (tok.size() > 2 && (tok[0]=='0') && (tok[1]=='x' || tok[1]=='X')) {
                tok = tok.substr(2);
            }
            if (tok.empty()) continue;

            if (!std::all_of(tok.begin(), tok.end(), is_hex)) {
                std::cerr << "[loadhex] non-hex token '" << tok
                          << "' at line " << lineno << "\n";
                return false;
            }
            // all-hex tokens longer than this cannot be a byte and would overflow stoul
            if (tok.size() > 2) {
                std::cerr << "[loadhex] byte out of range '" << tok
                          << "' at line " << lineno << "\n";
                return false;
            }
            out.push_back(static_cast<uint8_t>(std::stoul(tok, nullptr, 16)));
        }
    }
    if (out.empty()) {
        std::cerr << "[loadhex] no bytes read from '" << path << "'\n";
        return false;
    }
    return true;
}

ProgramImage make_image(const std::vector<uint8_t>& bytes, size_t origin) {
    if (origin > PROGRAM_BYTES || bytes.size() > PROGRAM_BYTES - origin)
        throw std::out_of_range("program of " + std::to_string(bytes.size()) +
                                " bytes does not fit at offset " + std::to_string(origin));
    ProgramImage img{};
    std::copy(bytes.begin(), bytes.end(), img.begin() + origin);
    return img;
}
