#include <cstring>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include <gtest/gtest.h>

#include "etfcast/etfcast.hpp"
#include "test_bytes.hpp"

namespace {
    namespace t = etfcast::testing;

    struct Address {
        std::string city;
        int zip{0};
    };

    struct User {
        int id{0};
        std::string name;
        std::string password;
        std::optional<Address> address;
        std::vector<std::string> tags;
        bool admin{false};
    };

    // Reads #{"c" => Degrees} itself and rejects anything below absolute zero.
    struct Celsius {
        double degrees{0};

        etfcast::core::Status decode_etf(const etfcast::cast::UncastedResult& raw) {
            std::map<std::string, double> fields;
            const etfcast::core::Status s = raw.cast_into(&fields);
            if (!etfcast::core::is_ok(s)) {
                return s;
            }
            const auto it = fields.find("c");
            if (it == fields.end() || it->second < -273.15) {
                return etfcast::core::make_status(etfcast::core::StatusDomain::Cast, etfcast::core::StatusCode::Invalid, 42);
            }
            degrees = it->second;
            return etfcast::core::ok_status();
        }
    };

    struct Reading {
        std::string sensor;
        Celsius temperature;
    };

    struct Handle {
        int id{0};
        std::string name;
        std::unique_ptr<int> slot;
    };

    t::Buf float_bytes(double v) {
        t::Buf out{70};
        etfcast::core::u64 bits = 0;
        std::memcpy(&bits, &v, sizeof(bits));
        for (int i = 7; i >= 0; --i) {
            out.push_back(static_cast<etfcast::core::u8>(bits >> (8 * i)));
        }
        return out;
    }
} // namespace

template <>
struct etfcast::cast::RecordFields<Address> {
    static auto fields() {
        return std::make_tuple(ETFCAST_FIELD(Address, city), ETFCAST_FIELD(Address, zip));
    }
};

template <>
struct etfcast::cast::RecordFields<User> {
    static auto fields() {
        return std::make_tuple(ETFCAST_FIELD(User, id),
                               ETFCAST_FIELD_TAG(User, name, "username"),
                               ETFCAST_FIELD_TAG(User, password, "-"),
                               ETFCAST_FIELD(User, address),
                               ETFCAST_FIELD(User, tags),
                               ETFCAST_FIELD(User, admin));
    }
};

template <>
struct etfcast::cast::RecordFields<Reading> {
    static auto fields() {
        return std::make_tuple(ETFCAST_FIELD(Reading, sensor), ETFCAST_FIELD(Reading, temperature));
    }
};

template <>
struct etfcast::cast::RecordFields<Handle> {
    static auto fields() {
        return std::make_tuple(ETFCAST_FIELD(Handle, id), ETFCAST_FIELD(Handle, name), ETFCAST_FIELD(Handle, slot));
    }
};

TEST(Record, DecodesFieldsByTag) {
    const t::Buf in = t::versioned(t::map({
        t::binary("id"), t::small_int(7),
        t::binary("username"), t::binary("ada"),
        t::binary("password"), t::binary("hunter2"),
        t::binary("extra"), t::list({t::small_int(1), t::map({t::atom("k"), t::nil()})}),
        t::binary("admin"), t::atom("true"),
        t::binary("tags"), t::list({t::binary("a"), t::binary("b")}),
    }));

    User u;
    u.password = "keep";
    ASSERT_EQ(etfcast::unpack(t::view(in), &u).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(u.id, 7);
    EXPECT_EQ(u.name, "ada");
    EXPECT_EQ(u.password, "keep");
    EXPECT_TRUE(u.admin);
    EXPECT_EQ(u.tags, (std::vector<std::string>{"a", "b"}));
    EXPECT_FALSE(u.address.has_value());
}

TEST(Record, MissingKeysKeepExistingValues) {
    const t::Buf in = t::versioned(t::map({t::binary("id"), t::small_int(3)}));
    User u;
    u.name = "grace";
    u.tags = {"old"};
    ASSERT_EQ(etfcast::unpack(t::view(in), &u).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(u.id, 3);
    EXPECT_EQ(u.name, "grace");
    EXPECT_EQ(u.tags, (std::vector<std::string>{"old"}));
}

TEST(Record, NestedOptionalRecordAndNilClear) {
    const t::Buf with_address = t::versioned(t::map({
        t::binary("address"), t::map({t::binary("city"), t::binary("Oslo"), t::binary("zip"), t::int32(150)}),
    }));
    User u;
    ASSERT_EQ(etfcast::unpack(t::view(with_address), &u).code, etfcast::core::StatusCode::Ok);
    ASSERT_TRUE(u.address.has_value());
    EXPECT_EQ(u.address->city, "Oslo");
    EXPECT_EQ(u.address->zip, 150);

    const t::Buf cleared = t::versioned(t::map({t::binary("address"), t::atom("nil")}));
    ASSERT_EQ(etfcast::unpack(t::view(cleared), &u).code, etfcast::core::StatusCode::Ok);
    EXPECT_FALSE(u.address.has_value());
}

TEST(Record, FieldErrorCarriesPath) {
    const t::Buf in = t::versioned(t::map({
        t::binary("address"), t::map({t::binary("zip"), t::atom("oops")}),
    }));
    User u;
    u.id = 11;
    etfcast::core::ErrorDetail detail;
    const etfcast::core::Status s = etfcast::unpack(t::view(in), &u, etfcast::core::DecoderConfig{}, &detail);
    EXPECT_EQ(s.code, etfcast::core::StatusCode::TypeMismatch);
    EXPECT_EQ(s.domain, etfcast::core::StatusDomain::Cast);
    EXPECT_EQ(detail.path, ".address.zip");
    EXPECT_STREQ(detail.target_shape, "integer");
    EXPECT_FALSE(u.address.has_value());
    EXPECT_EQ(u.id, 11);
}

TEST(Record, NonTextKeyIsMismatch) {
    const t::Buf in = t::versioned(t::map({t::binary("id"), t::small_int(1), t::atom("id"), t::small_int(2)}));
    User u;
    etfcast::core::ErrorDetail detail;
    EXPECT_EQ(etfcast::unpack(t::view(in), &u, etfcast::core::DecoderConfig{}, &detail).code,
              etfcast::core::StatusCode::TypeMismatch);
    EXPECT_EQ(detail.path, "{1}");
    EXPECT_STREQ(detail.term_kind, "atom");
    EXPECT_EQ(u.id, 0);
}

TEST(Record, ListOfRecordsIntoPointerChain) {
    const t::Buf in = t::versioned(t::list({
        t::map({t::binary("city"), t::binary("Rome")}),
        t::map({t::binary("city"), t::binary("Lima"), t::binary("zip"), t::small_int(9)}),
    }));
    std::unique_ptr<std::vector<Address>> out;
    ASSERT_EQ(etfcast::unpack(t::view(in), &out).code, etfcast::core::StatusCode::Ok);
    ASSERT_TRUE(out);
    ASSERT_EQ(out->size(), 2u);
    EXPECT_EQ((*out)[0].city, "Rome");
    EXPECT_EQ((*out)[0].zip, 0);
    EXPECT_EQ((*out)[1].zip, 9);
}

TEST(Record, MaterialisedTermCastsLikeStream) {
    const t::Buf in = t::versioned(t::map({t::binary("username"), t::binary("lin"), t::binary("id"), t::small_int(4)}));
    etfcast::wire::Term term;
    ASSERT_EQ(etfcast::unpack_term(t::view(in), &term).code, etfcast::core::StatusCode::Ok);

    User u;
    ASSERT_EQ(etfcast::UncastedResult(term).cast_into(&u).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(u.name, "lin");
    EXPECT_EQ(u.id, 4);
}

TEST(Record, DecodeHookTakesOver) {
    const t::Buf in = t::versioned(t::map({
        t::binary("sensor"), t::binary("s1"),
        t::binary("temperature"), t::map({t::binary("c"), float_bytes(21.5)}),
    }));
    Reading r;
    ASSERT_EQ(etfcast::unpack(t::view(in), &r).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(r.sensor, "s1");
    EXPECT_DOUBLE_EQ(r.temperature.degrees, 21.5);
}

TEST(Record, DecodeHookStatusIsReturnedUnchanged) {
    const t::Buf in = t::versioned(t::map({t::binary("c"), float_bytes(-300.0)}));
    Celsius c;
    c.degrees = 5;
    etfcast::core::ErrorDetail detail;
    const etfcast::core::Status s = etfcast::unpack(t::view(in), &c, etfcast::core::DecoderConfig{}, &detail);
    EXPECT_EQ(s.code, etfcast::core::StatusCode::Invalid);
    EXPECT_EQ(s.domain, etfcast::core::StatusDomain::Cast);
    EXPECT_EQ(s.aux, 42u);
    EXPECT_DOUBLE_EQ(c.degrees, 5);

    EXPECT_EQ(detail.status.code, etfcast::core::StatusCode::Invalid);
    EXPECT_EQ(detail.status.aux, 42u);
    EXPECT_STREQ(detail.target_shape, "record");
    EXPECT_EQ(detail.message, "decode hook failed");
}

TEST(Record, DecodeHookFailureInFieldCarriesPath) {
    const t::Buf in = t::versioned(t::map({
        t::binary("sensor"), t::binary("s2"),
        t::binary("temperature"), t::map({t::binary("c"), float_bytes(-500.0)}),
    }));
    Reading r;
    r.sensor = "old";
    etfcast::core::ErrorDetail detail;
    const etfcast::core::Status s = etfcast::unpack(t::view(in), &r, etfcast::core::DecoderConfig{}, &detail);
    EXPECT_EQ(s.code, etfcast::core::StatusCode::Invalid);
    EXPECT_EQ(detail.status.code, etfcast::core::StatusCode::Invalid);
    EXPECT_EQ(detail.path, ".temperature");
    EXPECT_EQ(r.sensor, "old");
}

TEST(Record, MoveOnlyRecordKeepsUnmentionedFields) {
    const t::Buf in = t::versioned(t::map({t::binary("slot"), t::small_int(5)}));
    Handle h;
    h.id = 42;
    h.name = "keep";
    ASSERT_EQ(etfcast::unpack(t::view(in), &h).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(h.id, 42);
    EXPECT_EQ(h.name, "keep");
    ASSERT_TRUE(h.slot);
    EXPECT_EQ(*h.slot, 5);
}

TEST(Record, MoveOnlyRecordFromTermKeepsUnmentionedFields) {
    const t::Buf in = t::versioned(t::map({t::binary("name"), t::binary("new")}));
    etfcast::wire::Term term;
    ASSERT_EQ(etfcast::unpack_term(t::view(in), &term).code, etfcast::core::StatusCode::Ok);

    Handle h;
    h.id = 8;
    h.slot = std::make_unique<int>(3);
    ASSERT_EQ(etfcast::UncastedResult(term).cast_into(&h).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(h.id, 8);
    EXPECT_EQ(h.name, "new");
    ASSERT_TRUE(h.slot);
    EXPECT_EQ(*h.slot, 3);
}

TEST(Record, MoveOnlyRecordUntouchedOnFailure) {
    const t::Buf in = t::versioned(t::map({t::binary("name"), t::binary("new"), t::binary("id"), t::atom("bad")}));
    Handle h;
    h.id = 1;
    h.name = "old";
    h.slot = std::make_unique<int>(9);
    EXPECT_EQ(etfcast::unpack(t::view(in), &h).code, etfcast::core::StatusCode::TypeMismatch);
    EXPECT_EQ(h.id, 1);
    EXPECT_EQ(h.name, "old");
    ASSERT_TRUE(h.slot);
    EXPECT_EQ(*h.slot, 9);
}

TEST(Record, NonMapIntoRecordIsMismatch) {
    const t::Buf in = t::versioned(t::list({t::small_int(1)}));
    User u;
    EXPECT_EQ(etfcast::unpack(t::view(in), &u).code, etfcast::core::StatusCode::TypeMismatch);
}
