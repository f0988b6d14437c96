// Unit coverage for the MSB-first bit cursor and the FLAC coded-number decoder.
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "bit_cursor.hpp"
#include "box_test_utils.hpp"
#include "flac_header.hpp"

using namespace formatprobe;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::fprintf(stderr, "[bit_cursor_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

bool test_reads_across_bytes() {
    const std::vector<uint8_t> data = {0xA5, 0x3C, 0xF0};
    BitCursor reader(data);
    bool ok = true;

    auto b = reader.read_bit();
    ok &= check(b.has_value() && *b, "first bit of 0xA5 is 1");
    auto three = reader.read(3);
    ok &= check(three && *three == 0x2, "next three bits 010");
    auto cross = reader.read(8);
    ok &= check(cross && *cross == 0x53, "8 bits spanning 0xA5/0x3C -> 0x53");
    ok &= check(reader.bit_position() == 12, "position advanced by 12 bits");
    ok &= check(reader.bytes_consumed() == 2, "partial byte counts as consumed");

    auto zero = reader.read(0);
    ok &= check(zero && *zero == 0, "read(0) yields 0");
    ok &= check(reader.bit_position() == 12, "read(0) does not move");
    return ok;
}

bool test_full_width_read() {
    const std::vector<uint8_t> data = {0xDE, 0xAD, 0xBE, 0xEF, 0x01};
    BitCursor reader(data);
    auto v = reader.read(32);
    bool ok = check(v && *v == 0xDEADBEEFu, "read(32) returns the first word");
    ok &= check(!reader.read(33).has_value(), "read(33) is rejected");
    ok &= check(reader.bit_position() == 32, "rejected width does not move");
    return ok;
}

bool test_end_of_input() {
    const std::vector<uint8_t> data = {0xFF};
    BitCursor reader(data);
    bool ok = check(!reader.read(9).has_value(), "read past the last byte fails");
    ok &= check(reader.bit_position() == 8, "cursor stops at the failing bit");
    ok &= check(!reader.read_bit().has_value(), "further reads keep failing");

    BitCursor empty(ByteView{});
    ok &= check(!empty.read_bit().has_value(), "empty buffer has no bits");
    return ok;
}

bool test_skip() {
    const std::vector<uint8_t> data = {0x00, 0x80};
    BitCursor reader(data);
    bool ok = check(reader.skip(8), "skip within buffer succeeds");
    auto bit = reader.read_bit();
    ok &= check(bit && *bit, "bit after skip is the MSB of the second byte");
    ok &= check(reader.skip(7), "skip exactly to the end succeeds");
    ok &= check(!reader.skip(1), "skip past the end fails");
    ok &= check(!reader.read_bit().has_value(), "no bits after failed skip");
    return ok;
}

// Encode `value` the way read_utf8_coded_number consumes it: 7 value bits per byte, least
// significant group first, continuation flag in the top bit.
std::vector<uint8_t> encode_coded_number(uint64_t value, unsigned groups) {
    std::vector<uint8_t> out;
    for (unsigned i = 0; i < groups; ++i) {
        uint8_t b = static_cast<uint8_t>((value >> (7 * i)) & 0x7F);
        if (i + 1 < groups) {
            b |= 0x80;
        }
        out.push_back(b);
    }
    return out;
}

bool test_coded_number() {
    bool ok = true;
    // Shift offsets 0, 7, ..., 35: one to six groups.
    for (unsigned groups = 1; groups <= 6; ++groups) {
        const uint64_t value = (uint64_t{1} << (7 * groups)) - 3;
        const auto bytes = encode_coded_number(value, groups);
        BitCursor reader(bytes);
        auto res = read_utf8_coded_number(reader);
        ok &= check(res.ok() && res.value == value,
                    "coded number round trip for " + std::to_string(groups) + " groups");
        ok &= check(reader.bit_position() == 8 * groups, "coded number consumes every byte");
    }

    // Seventh group lands at shift 42 only if its top five bits are clear.
    {
        std::vector<uint8_t> bytes = encode_coded_number(0, 6);
        bytes.back() |= 0x80;
        bytes.push_back(0x07);
        BitCursor reader(bytes);
        auto res = read_utf8_coded_number(reader);
        ok &= check(res.ok() && res.value == (uint64_t{7} << 42), "3-bit group at shift 42");
    }
    {
        std::vector<uint8_t> bytes = encode_coded_number(0, 6);
        bytes.back() |= 0x80;
        bytes.push_back(0x08);
        BitCursor reader(bytes);
        auto res = read_utf8_coded_number(reader);
        ok &= check(res.error == FlacError::UTF8DecodingError,
                    "group with upper bits set after shift 36 is rejected");
    }
    {
        const std::vector<uint8_t> bytes = {0x81, 0x82};
        BitCursor reader(bytes);
        auto res = read_utf8_coded_number(reader);
        ok &= check(res.error == FlacError::UnexpectedEndOfInput,
                    "unterminated coded number hits end of input");
    }
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_reads_across_bytes();
    ok &= test_full_width_read();
    ok &= test_end_of_input();
    ok &= test_skip();
    ok &= test_coded_number();
    return ok ? 0 : 1;
}
