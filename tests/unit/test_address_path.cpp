#include "cpeip/codec/address_path.hpp"

#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

int main() {
    using namespace cpeip::codec;

    // Test 1: Symbolic segment padding for every name length
    for (std::size_t length = 1; length <= 255; ++length) {
        const std::string name(length, 'A');
        const auto path = makeSymbolicPath(name);
        assert(path.size() % 2 == 0);
        assert(path[0] == 0x91);
        assert(path[1] == length);
        assert(path.size() == 2 + length + (length % 2));
    }

    // Test 2: Invalid symbolic names
    {
        bool threw = false;
        try {
            makeSymbolicPath("");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            makeSymbolicPath(std::string(256, 'A'));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // Test 3: Logical class/instance segments
    {
        assert(makeLogicalPath(ObjectClass::TagNameServer, 0) ==
               std::vector<std::uint8_t>({0x20, 0x6A, 0x25, 0x00, 0x00, 0x00}));
        assert(makeLogicalPath(ObjectClass::VariableObject, 0x0102) ==
               std::vector<std::uint8_t>({0x20, 0x6B, 0x25, 0x00, 0x02, 0x01}));
        assert(makeLogicalPath(0x0123, 5) ==
               std::vector<std::uint8_t>({0x21, 0x00, 0x23, 0x01, 0x25, 0x00, 0x05, 0x00}));
    }

    // Test 4: Element segments choose the narrowest form
    {
        assert(makeElementSegment(3) == std::vector<std::uint8_t>({0x28, 0x03}));
        assert(makeElementSegment(0x1234) == std::vector<std::uint8_t>({0x29, 0x00, 0x34, 0x12}));
        assert(makeElementSegment(0x12345678) ==
               std::vector<std::uint8_t>({0x2A, 0x00, 0x78, 0x56, 0x34, 0x12}));
    }

    // Test 5: Member and index paths
    {
        const auto path = makeVariablePath("Tank.Level[2,10]");
        const std::vector<std::uint8_t> expected = {
            0x91, 0x04, 'T', 'a', 'n', 'k',
            0x91, 0x05, 'L', 'e', 'v', 'e', 'l', 0x00,
            0x28, 0x02, 0x28, 0x0A};
        assert(path == expected);
        assert(makeVariablePath("Counter") == makeSymbolicPath("Counter"));

        for (const char* bad : {"", "A..B", "A[", "A[x]", "A[1", ".A"}) {
            bool threw = false;
            try {
                makeVariablePath(bad);
            } catch (const std::invalid_argument&) {
                threw = true;
            }
            assert(threw);
        }
    }

    // Test 6: Simple data segment
    {
        SimpleDataSegment segment{0x01F6, 0x00FA};
        assert(segment.encode() == std::vector<std::uint8_t>({0x80, 0x03, 0xF6, 0x01, 0x00, 0x00, 0xFA, 0x00}));

        const auto path = appendSimpleDataSegment(makeSymbolicPath("Msg"), SimpleDataSegment{0, 10});
        assert(path.size() == 6 + 8);
        assert(path[6] == 0x80);
        assert(path.size() % 2 == 0);
    }

    return 0;
}
