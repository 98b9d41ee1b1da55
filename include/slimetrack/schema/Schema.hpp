#pragma once
// Schema.hpp (C++17, header-only)
// -----------------------------------------------------------------------------
// Declarative binary packet schemas: a struct, a tuple of field descriptors in
// wire order, and optional cross-field rules. One schema drives both decode
// and encode, so the two directions cannot drift apart.
//
// Usage sketch:
//   struct Temp { uint8_t sensorId; float celsius; };
//   using namespace slimetrack::schema;
//   const auto tempSchema = makeSchema<Temp>(std::make_tuple(
//       field<&Temp::sensorId>("sensorId", BeU8{}),
//       field<&Temp::celsius >("celsius" , BeF32{})));
//   auto pkt  = decode(tempSchema, ByteView(bytes));
//   auto blob = encode(tempSchema, pkt.value());
//
// All multi-byte values are big-endian (network order).
// -----------------------------------------------------------------------------

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

namespace slimetrack::schema {

template<class T, class E>
using expected = tl::expected<T, E>;
template<class E>
using unexpected = tl::unexpected<E>;

// Read-only byte slice (stand-in for std::span<const std::byte>)
struct ByteView {
    const std::byte* ptr = nullptr;
    std::size_t len = 0;

    ByteView() = default;
    ByteView(const std::byte* p, std::size_t n) : ptr(p), len(n) {}
    ByteView(const std::uint8_t* p, std::size_t n)
    : ptr(reinterpret_cast<const std::byte*>(p)), len(n) {}

    template<class Container>
    explicit ByteView(const Container& c)
    : ptr(reinterpret_cast<const std::byte*>(c.data())), len(c.size()) {}

    std::size_t size() const { return len; }
    bool empty() const { return len == 0; }
    const std::byte* data() const { return ptr; }
    std::uint8_t at(std::size_t i) const { return static_cast<std::uint8_t>(ptr[i]); }

    ByteView subspan(std::size_t n) const {
        if (n > len) return {};
        return ByteView(ptr + n, len - n);
    }
};

// Shared by both directions: `where` names the field, `what` the problem.
struct CodecError {
    std::string where;
    std::string what;

    std::string describe() const { return where + ": " + what; }
};

using Bytes = std::vector<std::byte>;

// ============================================================================
// Codecs (value <-> bytes)
// ============================================================================
namespace detail {

template<class U>
expected<U, CodecError> readUnsigned(ByteView& s, const char* where) {
    constexpr std::size_t N = sizeof(U);
    if (s.size() < N) {
        return unexpected<CodecError>({where, "need " + std::to_string(N) + " byte(s)"});
    }
    U v = 0;
    for (std::size_t i = 0; i < N; ++i) {
        v = static_cast<U>((v << 8) | static_cast<U>(s.at(i)));
    }
    s = s.subspan(N);
    return v;
}

template<class U>
void writeUnsigned(U v, Bytes& out) {
    constexpr std::size_t N = sizeof(U);
    for (std::size_t i = 0; i < N; ++i) {
        const auto shift = 8 * (N - 1 - i);
        out.push_back(static_cast<std::byte>((v >> shift) & 0xFFu));
    }
}

} // namespace detail

struct BeU8 {
    using value_type = std::uint8_t;
    expected<value_type, CodecError> read(ByteView& s, const char* where) const {
        return detail::readUnsigned<std::uint8_t>(s, where);
    }
    void write(value_type v, Bytes& out) const { detail::writeUnsigned(v, out); }
};

struct BeI8 {
    using value_type = std::int8_t;
    expected<value_type, CodecError> read(ByteView& s, const char* where) const {
        auto raw = detail::readUnsigned<std::uint8_t>(s, where);
        if (!raw) return unexpected<CodecError>(raw.error());
        return static_cast<value_type>(*raw);
    }
    void write(value_type v, Bytes& out) const {
        detail::writeUnsigned(static_cast<std::uint8_t>(v), out);
    }
};

struct BeU32 {
    using value_type = std::uint32_t;
    expected<value_type, CodecError> read(ByteView& s, const char* where) const {
        return detail::readUnsigned<std::uint32_t>(s, where);
    }
    void write(value_type v, Bytes& out) const { detail::writeUnsigned(v, out); }
};

struct BeI32 {
    using value_type = std::int32_t;
    expected<value_type, CodecError> read(ByteView& s, const char* where) const {
        auto raw = detail::readUnsigned<std::uint32_t>(s, where);
        if (!raw) return unexpected<CodecError>(raw.error());
        return static_cast<value_type>(*raw);
    }
    void write(value_type v, Bytes& out) const {
        detail::writeUnsigned(static_cast<std::uint32_t>(v), out);
    }
};

struct BeU64 {
    using value_type = std::uint64_t;
    expected<value_type, CodecError> read(ByteView& s, const char* where) const {
        return detail::readUnsigned<std::uint64_t>(s, where);
    }
    void write(value_type v, Bytes& out) const { detail::writeUnsigned(v, out); }
};

// IEEE-754 binary32, transported as its big-endian bit pattern.
struct BeF32 {
    using value_type = float;
    static_assert(sizeof(float) == sizeof(std::uint32_t), "binary32 float required");

    expected<value_type, CodecError> read(ByteView& s, const char* where) const {
        auto raw = detail::readUnsigned<std::uint32_t>(s, where);
        if (!raw) return unexpected<CodecError>(raw.error());
        float v = 0.0f;
        const std::uint32_t bits = *raw;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }
    void write(value_type v, Bytes& out) const {
        std::uint32_t bits = 0;
        std::memcpy(&bits, &v, sizeof(bits));
        detail::writeUnsigned(bits, out);
    }
};

// Raw fixed-length bytes (MAC addresses, ping challenges).
template<std::size_t N>
struct FixedBytes {
    using value_type = std::array<std::uint8_t, N>;

    expected<value_type, CodecError> read(ByteView& s, const char* where) const {
        if (s.size() < N) {
            return unexpected<CodecError>({where, "need " + std::to_string(N) + " bytes"});
        }
        value_type out{};
        for (std::size_t i = 0; i < N; ++i) out[i] = s.at(i);
        s = s.subspan(N);
        return out;
    }
    void write(const value_type& a, Bytes& out) const {
        for (auto b : a) out.push_back(static_cast<std::byte>(b));
    }
};

// One length byte followed by that many printable ASCII characters.
struct ShortAscii {
    using value_type = std::string;

    expected<value_type, CodecError> read(ByteView& s, const char* where) const {
        auto len = detail::readUnsigned<std::uint8_t>(s, where);
        if (!len) return unexpected<CodecError>(len.error());
        if (s.size() < *len) return unexpected<CodecError>({where, "string truncated"});
        std::string out;
        out.reserve(*len);
        for (std::size_t i = 0; i < *len; ++i) {
            const auto c = s.at(i);
            if (c < 0x20 || c > 0x7E) return unexpected<CodecError>({where, "non-ASCII char"});
            out.push_back(static_cast<char>(c));
        }
        s = s.subspan(*len);
        return out;
    }
    // Length is enforced by the AsciiLength validator before writing.
    void write(const value_type& v, Bytes& out) const {
        out.push_back(static_cast<std::byte>(v.size() & 0xFFu));
        for (char c : v) out.push_back(static_cast<std::byte>(static_cast<unsigned char>(c)));
    }
};

// ============================================================================
// Validators
// ============================================================================
template<class Enum, std::uint8_t Min, std::uint8_t Max>
struct EnumRange {
    template<class U>
    expected<void, CodecError> operator()(const char* where, const U& raw) const {
        const auto v = static_cast<long long>(raw);
        if (v < Min || v > Max) {
            std::ostringstream msg;
            msg << "unknown enum value " << v
                << " (expected " << static_cast<int>(Min)
                << "-" << static_cast<int>(Max) << ")";
            return unexpected<CodecError>({where, msg.str()});
        }
        return {};
    }
};

template<std::size_t Min, std::size_t Max>
struct AsciiLength {
    expected<void, CodecError> operator()(const char* where, const std::string& s) const {
        if (s.size() < Min || s.size() > Max) {
            std::ostringstream msg;
            msg << "length " << s.size() << " outside " << Min << "-" << Max;
            return unexpected<CodecError>({where, msg.str()});
        }
        for (char c : s) {
            const auto u = static_cast<unsigned char>(c);
            if (u < 0x20 || u > 0x7E) return unexpected<CodecError>({where, "non-ASCII char"});
        }
        return {};
    }
};

// ============================================================================
// Field descriptor + helper
// ============================================================================
template<auto MemberPtr, class Codec, class... Validators>
struct Field {
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
// Object-level validator
// ============================================================================
template<class Fn>
struct ObjectValidator {
    Fn fn;

    template<class T>
    expected<void, CodecError> operator()(const T& obj) const { return fn(obj); }
};

template<class Fn>
ObjectValidator<Fn> objectValidator(Fn fn) { return ObjectValidator<Fn>{fn}; }

struct NoObjectValidator {
    template<class T>
    expected<void, CodecError> operator()(const T&) const { return {}; }
};

// ============================================================================
// Schema
// ============================================================================
template<class T, class FieldsTuple, class ObjValidator>
struct Schema {
    FieldsTuple  fields;
    ObjValidator objValidator;
};

template<class T, class... FieldDescs>
Schema<T, std::tuple<FieldDescs...>, NoObjectValidator>
makeSchema(std::tuple<FieldDescs...> fds) {
    return { std::move(fds), NoObjectValidator{} };
}

template<class T, class... FieldDescs, class Fn>
Schema<T, std::tuple<FieldDescs...>, ObjectValidator<Fn>>
makeSchema(std::tuple<FieldDescs...> fds, ObjectValidator<Fn> ov) {
    return { std::move(fds), ov };
}

// Schema for payload-less packets.
template<class T>
Schema<T, std::tuple<>, NoObjectValidator> makeEmptySchema() {
    return { std::tuple<>{}, NoObjectValidator{} };
}

namespace detail {

template<class T, bool IsEnum>
struct NormalizeImpl { using type = T; };

template<class T>
struct NormalizeImpl<T, true> { using type = typename std::underlying_type<T>::type; };

template<class T>
using normalize_t = typename NormalizeImpl<T, std::is_enum<T>::value>::type;

template<class FieldDesc, class V>
expected<void, CodecError> runValidatorsOn(const FieldDesc& fd, const V& vv) {
    expected<void, CodecError> ok{};
    std::apply([&](auto const&... val) {
        ( ( [&]() {
            if (!ok) return;
            auto r = val(fd.name, vv);
            if (!r) ok = unexpected<CodecError>(r.error());
        }() ), ... );
    }, fd.validators);
    return ok;
}

// Enums are validated as their underlying integer.
template<class FieldDesc, class V>
expected<void, CodecError> runFieldValidators(const FieldDesc& fd, const V& v) {
    if constexpr (std::is_enum_v<V>) {
        const normalize_t<V> vv = static_cast<normalize_t<V>>(v);
        return runValidatorsOn(fd, vv);
    } else {
        return runValidatorsOn(fd, v);
    }
}

} // namespace detail

// ============================================================================
// decode / encode
// ============================================================================

// Decode one object from the front of @p s and advance past it. Trailing
// bytes are left in @p s for the caller to judge.
template<class T, class FieldsTuple, class ObjValidatorT>
expected<T, CodecError>
decodeFrom(const Schema<T, FieldsTuple, ObjValidatorT>& sch, ByteView& s) {
    T obj{};
    bool failed = false;
    CodecError err;

    std::apply([&](auto const&... fd) {
        ( ( [&]() {
            if (failed) return;

            using MemberT = typename std::remove_reference<decltype(obj.*(fd.memberPtr))>::type;

            auto raw = fd.codec.read(s, fd.name);
            if (!raw) { failed = true; err = raw.error(); return; }

            if (auto ok = detail::runFieldValidators(fd, *raw); !ok) {
                failed = true; err = ok.error(); return;
            }

            if constexpr (std::is_enum_v<MemberT>) {
                obj.*(fd.memberPtr) = static_cast<MemberT>(*raw);
            } else {
                obj.*(fd.memberPtr) = std::move(*raw);
            }
        }() ), ... );
    }, sch.fields);

    if (failed) return unexpected<CodecError>(err);

    if (auto ok = sch.objValidator(obj); !ok)
        return unexpected<CodecError>(ok.error());

    return obj;
}

template<class T, class FieldsTuple, class ObjValidatorT>
expected<T, CodecError>
decode(const Schema<T, FieldsTuple, ObjValidatorT>& sch, ByteView bytes) {
    return decodeFrom(sch, bytes);
}

// Append the encoding of @p obj to @p out. On failure @p out may hold a
// partial encoding.
template<class T, class FieldsTuple, class ObjValidatorT>
expected<void, CodecError>
encodeInto(const Schema<T, FieldsTuple, ObjValidatorT>& sch, const T& obj, Bytes& out) {
    if (auto ok = sch.objValidator(obj); !ok)
        return unexpected<CodecError>(ok.error());

    bool failed = false;
    CodecError err;

    std::apply([&](auto const&... fd) {
        ( ( [&]() {
            if (failed) return;

            const auto& v = obj.*(fd.memberPtr);
            using V = std::decay_t<decltype(v)>;
            using Wire = typename std::decay_t<decltype(fd.codec)>::value_type;

            if (auto ok = detail::runFieldValidators(fd, v); !ok) {
                failed = true; err = ok.error(); return;
            }

            if constexpr (std::is_enum_v<V>) {
                using U = typename std::underlying_type<V>::type;
                fd.codec.write(static_cast<Wire>(static_cast<U>(v)), out);
            } else {
                fd.codec.write(v, out);
            }
        }() ), ... );
    }, sch.fields);

    if (failed) return unexpected<CodecError>(err);
    return {};
}

template<class T, class FieldsTuple, class ObjValidatorT>
expected<Bytes, CodecError>
encode(const Schema<T, FieldsTuple, ObjValidatorT>& sch, const T& obj) {
    Bytes out;
    if (auto ok = encodeInto(sch, obj, out); !ok)
        return unexpected<CodecError>(ok.error());
    return out;
}

} // namespace slimetrack::schema
