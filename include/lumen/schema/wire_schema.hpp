#pragma once
// wire_schema.hpp (C++17, header-only)
// -----------------------------------------------------------------------------
// Declarative binary layouts for fixed protocol headers.
//
// A header is described once as a tuple of fields, each binding a struct
// member to a codec (byte width + endianness) and optional validators. The
// same schema then encodes a header template and decodes captured packets:
//
//   struct OpcHeader { uint8_t channel; uint8_t command; uint16_t length; };
//   using namespace lumen::schema;
//   inline const auto opcSchema = makeSchema<OpcHeader>(std::make_tuple(
//       field<&OpcHeader::channel>("channel", U8{}),
//       field<&OpcHeader::command>("command", U8{}, Equals<0>{}),
//       field<&OpcHeader::length >("length" , BeU16{})));
//   auto bytes  = encode(opcSchema, OpcHeader{1, 0, 30});
//   auto header = decode(opcSchema, ByteView(bytes.value()));
//
// Depends on: TartanLlama expected (single header): tl/expected.hpp
// -----------------------------------------------------------------------------

#include <array>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

namespace lumen::schema {

template<class T, class E>
using expected = tl::expected<T, E>;
template<class E>
using unexpected = tl::unexpected<E>;

// Read-only byte slice over any contiguous container of byte-sized elements.
struct ByteView {
    const std::uint8_t* ptr = nullptr;
    std::size_t len = 0;

    ByteView() = default;
    ByteView(const std::uint8_t* p, std::size_t n) : ptr(p), len(n) {}

    template<class Container>
    explicit ByteView(const Container& c)
    : ptr(reinterpret_cast<const std::uint8_t*>(c.data())), len(c.size()) {
        static_assert(sizeof(*c.data()) == 1, "ByteView requires a byte container");
    }

    std::size_t size() const { return len; }
    const std::uint8_t* data() const { return ptr; }
    std::uint8_t operator[](std::size_t i) const { return ptr[i]; }

    ByteView subspan(std::size_t n) const {
        if (n > len) return {};
        return ByteView(ptr + n, len - n);
    }
};

struct SchemaError {
    std::string where;
    std::string what;
};

using Bytes = std::vector<std::uint8_t>;

// ============================================================================
// Codecs
// ============================================================================
struct U8 {
    static constexpr std::size_t width = 1;

    expected<std::uint8_t, SchemaError> read(ByteView& s, const char* where) const {
        if (s.size() < width) return unexpected<SchemaError>({where, "need 1 byte"});
        const auto v = s[0];
        s = s.subspan(width);
        return v;
    }
    void write(std::uint8_t v, Bytes& out) const { out.push_back(v); }
};

namespace detail {

template<class UInt, bool BigEndian>
struct Integer {
    static constexpr std::size_t width = sizeof(UInt);

    expected<UInt, SchemaError> read(ByteView& s, const char* where) const {
        if (s.size() < width) {
            return unexpected<SchemaError>({where, "need " + std::to_string(width) + " bytes"});
        }
        UInt v = 0;
        for (std::size_t i = 0; i < width; ++i) {
            const std::size_t shift = BigEndian ? (width - 1 - i) * 8 : i * 8;
            v = static_cast<UInt>(v | (static_cast<UInt>(s[i]) << shift));
        }
        s = s.subspan(width);
        return v;
    }

    void write(UInt v, Bytes& out) const {
        for (std::size_t i = 0; i < width; ++i) {
            const std::size_t shift = BigEndian ? (width - 1 - i) * 8 : i * 8;
            out.push_back(static_cast<std::uint8_t>((v >> shift) & 0xFFu));
        }
    }
};

} // namespace detail

using BeU16 = detail::Integer<std::uint16_t, true>;
using BeU32 = detail::Integer<std::uint32_t, true>;
using LeU16 = detail::Integer<std::uint16_t, false>;
using LeU32 = detail::Integer<std::uint32_t, false>;

// Opaque fixed-length bytes. Maps to std::array<uint8_t, N>.
template<std::size_t N>
struct FixedBytes {
    static constexpr std::size_t width = N;
    using Arr = std::array<std::uint8_t, N>;

    expected<Arr, SchemaError> read(ByteView& s, const char* where) const {
        if (s.size() < N) return unexpected<SchemaError>({where, "not enough bytes"});
        Arr out{};
        for (std::size_t i = 0; i < N; ++i) out[i] = s[i];
        s = s.subspan(N);
        return out;
    }
    void write(const Arr& a, Bytes& out) const {
        out.insert(out.end(), a.begin(), a.end());
    }
};

// Fixed-length ASCII (printable or zero padding). Maps to std::array<char, N>.
template<std::size_t N>
struct FixedAscii {
    static constexpr std::size_t width = N;
    using Arr = std::array<char, N>;

    expected<Arr, SchemaError> read(ByteView& s, const char* where) const {
        if (s.size() < N) return unexpected<SchemaError>({where, "not enough bytes"});
        Arr out{};
        for (std::size_t i = 0; i < N; ++i) {
            const char c = static_cast<char>(s[i]);
            if (c != 0 && (c < 0x20 || c > 0x7E)) {
                return unexpected<SchemaError>({where, "non-ASCII char"});
            }
            out[i] = c;
        }
        s = s.subspan(N);
        return out;
    }
    void write(const Arr& a, Bytes& out) const {
        for (char c : a) out.push_back(static_cast<std::uint8_t>(c));
    }
};

// ============================================================================
// Validators
// ============================================================================

// Field must hold a protocol constant (magic numbers, fixed opcodes).
template<std::uint64_t Value>
struct Equals {
    template<class U>
    expected<void, SchemaError> operator()(const char* where, const U& v) const {
        if constexpr (std::is_integral<U>::value) {
            if (static_cast<std::uint64_t>(v) != Value) {
                std::ostringstream msg;
                msg << "expected 0x" << std::hex << Value << " got 0x" << static_cast<std::uint64_t>(v);
                return unexpected<SchemaError>({where, msg.str()});
            }
        }
        return {};
    }
};

template<std::uint64_t Max>
struct AtMost {
    template<class U>
    expected<void, SchemaError> operator()(const char* where, const U& v) const {
        if constexpr (std::is_integral<U>::value) {
            if (static_cast<std::uint64_t>(v) > Max) {
                return unexpected<SchemaError>({where, "exceeds " + std::to_string(Max)});
            }
        }
        return {};
    }
};

// ============================================================================
// Field descriptor
// ============================================================================
template<auto MemberPtr, class Codec, class... Validators>
struct Field {
    using codec_type = Codec;
    static constexpr auto memberPtr = MemberPtr;
    const char* name;
    Codec codec;
    std::tuple<Validators...> validators;
};

template<auto MemberPtr, class Codec, class... Validators>
Field<MemberPtr, Codec, Validators...>
field(const char* name, Codec c, Validators... vs) {
    return { name, c, std::tuple<Validators...>{vs...} };
}

// ============================================================================
// Schema
// ============================================================================
template<class T, class FieldsTuple>
struct Schema {
    FieldsTuple fields;

    /// Total encoded size in bytes.
    static constexpr std::size_t width() {
        return widthOf(std::make_index_sequence<std::tuple_size<FieldsTuple>::value>{});
    }

private:
    template<std::size_t... I>
    static constexpr std::size_t widthOf(std::index_sequence<I...>) {
        return (std::size_t{0} + ... +
            std::remove_reference_t<decltype(std::get<I>(std::declval<FieldsTuple&>()))>::codec_type::width);
    }
};

template<class T, class... FieldDescs>
Schema<T, std::tuple<FieldDescs...>> makeSchema(std::tuple<FieldDescs...> fds) {
    return { std::move(fds) };
}

namespace detail {

template<class FieldDesc, class V>
expected<void, SchemaError> runValidators(const FieldDesc& fd, const V& v) {
    expected<void, SchemaError> ok{};
    std::apply([&](auto const&... validator) {
        ( ( [&]() {
            if (!ok) return;
            auto r = validator(fd.name, v);
            if (!r) ok = unexpected<SchemaError>(r.error());
        }() ), ... );
    }, fd.validators);
    return ok;
}

} // namespace detail

// ============================================================================
// decode / encode
// ============================================================================
template<class T, class FieldsTuple>
expected<T, SchemaError> decode(const Schema<T, FieldsTuple>& sch, ByteView bytes) {
    T obj{};
    ByteView s = bytes;
    bool failed = false;
    SchemaError err;

    std::apply([&](auto const&... fd) {
        ( ( [&]() {
            if (failed) return;
            auto raw = fd.codec.read(s, fd.name);
            if (!raw) { failed = true; err = raw.error(); return; }
            if (auto ok = detail::runValidators(fd, *raw); !ok) {
                failed = true; err = ok.error(); return;
            }
            obj.*(fd.memberPtr) = *raw;
        }() ), ... );
    }, sch.fields);

    if (failed) return unexpected<SchemaError>(err);
    return obj;
}

template<class T, class FieldsTuple>
expected<Bytes, SchemaError> encode(const Schema<T, FieldsTuple>& sch, const T& obj) {
    Bytes out;
    out.reserve(Schema<T, FieldsTuple>::width());
    bool failed = false;
    SchemaError err;

    std::apply([&](auto const&... fd) {
        ( ( [&]() {
            if (failed) return;
            const auto& v = obj.*(fd.memberPtr);
            if (auto ok = detail::runValidators(fd, v); !ok) {
                failed = true; err = ok.error(); return;
            }
            fd.codec.write(v, out);
        }() ), ... );
    }, sch.fields);

    if (failed) return unexpected<SchemaError>(err);
    return out;
}

} // namespace lumen::schema
