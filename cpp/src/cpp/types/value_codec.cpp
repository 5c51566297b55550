#include <bspgraph/types/value_codec.h>
#include <bspgraph/util/errors.h>

#include <bit>
#include <cstring>

namespace bspgraph {

    namespace {
        struct ValueWriter {
            bytes_t out;

            void write_u8(uint8_t v) { out.push_back(v); }

            void write_u32(uint32_t v) {
                for (int i = 0; i < 4; ++i) { out.push_back(static_cast<uint8_t>(v >> (8 * i))); }
            }

            void write_u64(uint64_t v) {
                for (int i = 0; i < 8; ++i) { out.push_back(static_cast<uint8_t>(v >> (8 * i))); }
            }

            void write_bytes(const std::string &s) {
                write_u64(s.size());
                out.insert(out.end(), s.begin(), s.end());
            }

            void write(const Value &value) {
                using namespace value_format;
                switch (value.kind()) {
                    case ValueKind::NONE: write_u8(TYPE_NONE); break;
                    case ValueKind::BOOL:
                        write_u8(TYPE_BOOL);
                        write_u8(value.as_bool() ? 1 : 0);
                        break;
                    case ValueKind::INT:
                        write_u8(TYPE_INT64);
                        write_u64(static_cast<uint64_t>(value.as_int()));
                        break;
                    case ValueKind::DOUBLE:
                        write_u8(TYPE_FLOAT64);
                        write_u64(std::bit_cast<uint64_t>(value.as_double()));
                        break;
                    case ValueKind::STRING:
                        write_u8(TYPE_STRING);
                        write_bytes(value.as_string());
                        break;
                    case ValueKind::LIST:
                        write_u8(TYPE_LIST);
                        write_u64(value.as_list().size());
                        for (const auto &item: value.as_list()) { write(item); }
                        break;
                    case ValueKind::MAP:
                        write_u8(TYPE_MAP);
                        write_u64(value.as_map().size());
                        for (const auto &[key, item]: value.as_map()) {
                            write_bytes(key);
                            write(item);
                        }
                        break;
                }
            }
        };

        struct ValueReader {
            std::span<const uint8_t> in;
            size_t pos{0};

            [[noreturn]] void fail(std::string_view reason) const {
                throw ChannelError{ChannelError::Kind::SERIALIZATION_ERROR,
                                   fmt::format("{} at byte offset {}", reason, pos)};
            }

            void require(size_t n) const {
                if (in.size() - pos < n) { fail(fmt::format("truncated input, needed {} more bytes", n)); }
            }

            uint8_t read_u8() {
                require(1);
                return in[pos++];
            }

            uint32_t read_u32() {
                require(4);
                uint32_t v{0};
                for (int i = 0; i < 4; ++i) { v |= static_cast<uint32_t>(in[pos++]) << (8 * i); }
                return v;
            }

            uint64_t read_u64() {
                require(8);
                uint64_t v{0};
                for (int i = 0; i < 8; ++i) { v |= static_cast<uint64_t>(in[pos++]) << (8 * i); }
                return v;
            }

            std::string read_string() {
                auto len = read_u64();
                require(len);
                std::string s(reinterpret_cast<const char *>(in.data() + pos), len);
                pos += len;
                return s;
            }

            Value read(size_t depth) {
                using namespace value_format;
                if (depth > MAX_DEPTH) { fail("nesting too deep"); }
                auto tag = read_u8();
                switch (tag) {
                    case TYPE_NONE: return Value{};
                    case TYPE_BOOL: {
                        auto b = read_u8();
                        if (b > 1) { fail(fmt::format("invalid bool byte {}", b)); }
                        return Value{b == 1};
                    }
                    case TYPE_INT64: return Value{static_cast<int64_t>(read_u64())};
                    case TYPE_FLOAT64: return Value{std::bit_cast<double>(read_u64())};
                    case TYPE_STRING: return Value{read_string()};
                    case TYPE_LIST: {
                        auto count = read_u64();
                        // Every element takes at least one byte.
                        require(count);
                        Value::list_t items;
                        items.reserve(count);
                        for (uint64_t i = 0; i < count; ++i) { items.push_back(read(depth + 1)); }
                        return Value{std::move(items)};
                    }
                    case TYPE_MAP: {
                        auto count = read_u64();
                        require(count);
                        Value::map_t items;
                        for (uint64_t i = 0; i < count; ++i) {
                            auto key = read_string();
                            items.insert_or_assign(std::move(key), read(depth + 1));
                        }
                        return Value{std::move(items)};
                    }
                    default: fail(fmt::format("unknown type tag 0x{:02x}", tag));
                }
            }
        };
    } // namespace

    bytes_t encode_value(const Value &value) {
        ValueWriter writer;
        writer.write_u32(value_format::MAGIC);
        writer.write_u8(value_format::VERSION);
        writer.write(value);
        return std::move(writer.out);
    }

    Value decode_value(std::span<const uint8_t> bytes) {
        ValueReader reader{bytes};
        if (reader.read_u32() != value_format::MAGIC) { reader.fail("bad magic header"); }
        if (auto version = reader.read_u8(); version != value_format::VERSION) {
            reader.fail(fmt::format("unsupported format version {}", version));
        }
        auto value = reader.read(0);
        if (reader.pos != bytes.size()) { reader.fail("trailing bytes after value"); }
        return value;
    }

} // namespace bspgraph
