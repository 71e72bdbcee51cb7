// Fuzz target for decode_change_set(): exercises header checks, inflate and
// record parsing. Any change set that decodes is re-encoded and decoded again.
// The same input is also walked as a stream of LEB128 integers through the
// wire reader, and every value read must survive a write and read back.

#include <ledgersync/codec.hpp>
#include <ledgersync/error.hpp>
#include "src/codec/reader.hpp"
#include "src/codec/writer.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace {

void walk_integers(std::span<const std::byte> input) {
    auto reader = ledgersync::codec::Reader{input};
    auto signed_next = false;
    while (!reader.at_end()) {
        const auto before = reader.remaining();
        auto writer = ledgersync::codec::Writer{};
        if (signed_next) {
            auto v = reader.read_sleb128();
            if (!v) return;
            writer.write_sleb128(*v);
            auto back = ledgersync::codec::Reader{writer.data()};
            if (back.read_sleb128() != v || !back.at_end()) __builtin_trap();
        } else {
            auto v = reader.read_uleb128();
            if (!v) return;
            writer.write_uleb128(*v);
            auto back = ledgersync::codec::Reader{writer.data()};
            if (back.read_uleb128() != v || !back.at_end()) __builtin_trap();
        }
        if (reader.remaining() >= before) __builtin_trap();
        signed_next = !signed_next;
    }
}

}  // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    walk_integers(span);

    try {
        auto records = ledgersync::decode_change_set(span);
        auto encoded = ledgersync::encode_change_set(records);
        auto again = ledgersync::decode_change_set(encoded);
        if (again.size() != records.size()) __builtin_trap();
    } catch (const ledgersync::DecodeError&) {
        // Rejected input is the expected outcome for most of the corpus.
    }
    return 0;
}
