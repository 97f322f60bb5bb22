#include "qrfile/hex.hpp"

#include <array>

namespace qrfile::hex {

namespace {

constexpr char kEncTable[] = "0123456789abcdef";

std::array<std::int8_t, 256> BuildDecodeTable() {
    std::array<std::int8_t, 256> table{};
    table.fill(-1);
    for (int i = 0; i < 10; ++i) {
        table['0' + i] = static_cast<std::int8_t>(i);
    }
    for (int i = 0; i < 6; ++i) {
        table['a' + i] = static_cast<std::int8_t>(10 + i);
        table['A' + i] = static_cast<std::int8_t>(10 + i);
    }
    return table;
}

const std::array<std::int8_t, 256> kDecTable = BuildDecodeTable();

}  // namespace

std::string Encode(const std::vector<std::uint8_t>& data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (std::uint8_t byte : data) {
        out.push_back(kEncTable[(byte >> 4) & 0x0F]);
        out.push_back(kEncTable[byte & 0x0F]);
    }
    return out;
}

std::vector<std::uint8_t> Decode(std::string_view input, bool* ok) {
    std::vector<std::uint8_t> out;
    bool success = input.size() % 2 == 0;
    if (success) {
        out.reserve(input.size() / 2);
        for (std::size_t i = 0; i < input.size(); i += 2) {
            std::int8_t hi = kDecTable[static_cast<unsigned char>(input[i])];
            std::int8_t lo = kDecTable[static_cast<unsigned char>(input[i + 1])];
            if (hi < 0 || lo < 0) {
                success = false;
                break;
            }
            out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
        }
    }
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.clear();
    }
    return out;
}

bool IsHex(std::string_view input) {
    for (unsigned char c : input) {
        if (kDecTable[c] < 0) {
            return false;
        }
    }
    return true;
}

}  // namespace qrfile::hex
