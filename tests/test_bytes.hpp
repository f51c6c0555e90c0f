#pragma once

#include <initializer_list>
#include <string>
#include <vector>

#include "etfcast/core/types.hpp"

// Hand-assembled ETF fragments for tests.
namespace etfcast::testing {
    using Buf = std::vector<etfcast::core::u8>;

    inline void put_u32(Buf* out, etfcast::core::u32 v) {
        out->push_back(static_cast<etfcast::core::u8>(v >> 24));
        out->push_back(static_cast<etfcast::core::u8>(v >> 16));
        out->push_back(static_cast<etfcast::core::u8>(v >> 8));
        out->push_back(static_cast<etfcast::core::u8>(v));
    }

    inline Buf cat(std::initializer_list<Buf> parts) {
        Buf out;
        for (const Buf& p : parts) {
            out.insert(out.end(), p.begin(), p.end());
        }
        return out;
    }

    inline Buf small_int(etfcast::core::u8 v) { return Buf{97, v}; }

    inline Buf int32(etfcast::core::i32 v) {
        Buf out{98};
        put_u32(&out, static_cast<etfcast::core::u32>(v));
        return out;
    }

    inline Buf atom(const std::string& name) {
        Buf out{119, static_cast<etfcast::core::u8>(name.size())};
        out.insert(out.end(), name.begin(), name.end());
        return out;
    }

    inline Buf binary(const std::string& s) {
        Buf out{109};
        put_u32(&out, static_cast<etfcast::core::u32>(s.size()));
        out.insert(out.end(), s.begin(), s.end());
        return out;
    }

    inline Buf nil() { return Buf{106}; }

    // Proper list: elements then the `j` tail.
    inline Buf list(std::initializer_list<Buf> items) {
        Buf out{108};
        put_u32(&out, static_cast<etfcast::core::u32>(items.size()));
        for (const Buf& i : items) {
            out.insert(out.end(), i.begin(), i.end());
        }
        out.push_back(106);
        return out;
    }

    // Alternating key, value fragments.
    inline Buf map(std::initializer_list<Buf> kvs) {
        Buf out{116};
        put_u32(&out, static_cast<etfcast::core::u32>(kvs.size() / 2));
        for (const Buf& i : kvs) {
            out.insert(out.end(), i.begin(), i.end());
        }
        return out;
    }

    inline Buf versioned(const Buf& term) {
        Buf out{131};
        out.insert(out.end(), term.begin(), term.end());
        return out;
    }

    inline etfcast::core::BufferView view(const Buf& b) {
        return etfcast::core::BufferView{b.data(), static_cast<etfcast::core::u32>(b.size())};
    }
} // namespace etfcast::testing
