#include <map>
#include <string>
#include <tuple>
#include <vector>

#include <gtest/gtest.h>

#include "etfcast/etfcast.hpp"
#include "test_bytes.hpp"

namespace {
    namespace t = etfcast::testing;

    struct Point {
        int x{0};
        int y{0};
    };

    struct Envelope {
        std::string kind;
        etfcast::RawData payload;
    };
} // namespace

template <>
struct etfcast::cast::RecordFields<Point> {
    static auto fields() {
        return std::make_tuple(ETFCAST_FIELD(Point, x), ETFCAST_FIELD(Point, y));
    }
};

template <>
struct etfcast::cast::RecordFields<Envelope> {
    static auto fields() {
        return std::make_tuple(ETFCAST_FIELD(Envelope, kind), ETFCAST_FIELD(Envelope, payload));
    }
};

TEST(RawData, TopLevelCaptureIsExactAndIgnoresTrailingBytes) {
    const t::Buf term = t::list({t::small_int(1), t::atom("two")});
    t::Buf in = t::versioned(term);
    in.push_back(0xff);

    etfcast::RawData raw;
    ASSERT_EQ(etfcast::unpack(t::view(in), &raw).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(raw.bytes(), term);
}

TEST(RawData, RecordFieldCapturedThenCastLater) {
    const t::Buf point = t::map({t::binary("x"), t::small_int(3), t::binary("y"), t::int32(-4)});
    const t::Buf in = t::versioned(t::map({t::binary("kind"), t::binary("point"), t::binary("payload"), point}));

    Envelope env;
    ASSERT_EQ(etfcast::unpack(t::view(in), &env).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(env.kind, "point");
    EXPECT_EQ(env.payload.bytes(), point);

    Point p;
    ASSERT_EQ(env.payload.cast_into(&p).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(p.x, 3);
    EXPECT_EQ(p.y, -4);

    etfcast::wire::Term dynamic;
    ASSERT_EQ(env.payload.cast_into(&dynamic).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(dynamic.kind(), etfcast::wire::TermKind::Map);
}

TEST(RawData, NestedMarkersCaptureAgain) {
    const t::Buf inner = t::list({t::small_int(8)});
    const t::Buf envelope = t::map({t::binary("kind"), t::binary("outer"), t::binary("payload"), inner});
    const t::Buf in = t::versioned(t::list({envelope, t::small_int(5)}));

    std::vector<etfcast::RawData> items;
    ASSERT_EQ(etfcast::unpack(t::view(in), &items).code, etfcast::core::StatusCode::Ok);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].bytes(), envelope);
    EXPECT_EQ(items[1].bytes(), t::small_int(5));

    Envelope env;
    ASSERT_EQ(items[0].cast_into(&env).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(env.kind, "outer");
    EXPECT_EQ(env.payload.bytes(), inner);

    std::vector<int> values;
    ASSERT_EQ(env.payload.cast_into(&values).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(values, (std::vector<int>{8}));
}

TEST(RawData, MapValuesCaptured) {
    const t::Buf in = t::versioned(t::map({t::binary("a"), t::binary("x"), t::binary("b"), t::nil()}));
    std::map<std::string, etfcast::RawData> out;
    ASSERT_EQ(etfcast::unpack(t::view(in), &out).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(out["a"].bytes(), t::binary("x"));
    EXPECT_EQ(out["b"].bytes(), t::nil());
}

TEST(RawData, CastIntoWrongShapeFails) {
    const t::Buf in = t::versioned(t::atom("hello"));
    etfcast::RawData raw;
    ASSERT_EQ(etfcast::unpack(t::view(in), &raw).code, etfcast::core::StatusCode::Ok);

    int n = 0;
    etfcast::core::ErrorDetail detail;
    EXPECT_EQ(raw.cast_into(&n, etfcast::core::DecoderConfig{}, &detail).code, etfcast::core::StatusCode::TypeMismatch);
    EXPECT_STREQ(detail.term_kind, "atom");

    etfcast::wire::Atom a;
    ASSERT_EQ(raw.cast_into(&a).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(a.name, "hello");
}

TEST(RawData, EmptyCaptureCannotBeCast) {
    const etfcast::RawData raw;
    int n = 0;
    const etfcast::core::Status s = raw.cast_into(&n);
    EXPECT_EQ(s.code, etfcast::core::StatusCode::Truncated);
    EXPECT_EQ(s.domain, etfcast::core::StatusDomain::Wire);
}

TEST(RawData, HonoursListTailConfiguration) {
    etfcast::core::DecoderConfig cfg{};
    cfg.list_tail = etfcast::core::ListTail::Omitted;
    const t::Buf in = {131, 108, 0, 0, 0, 2, 97, 1, 97, 2};

    etfcast::RawData raw;
    ASSERT_EQ(etfcast::unpack(t::view(in), &raw, cfg).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(raw.bytes().size(), 9u);

    std::vector<int> values;
    ASSERT_EQ(raw.cast_into(&values, cfg).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(values, (std::vector<int>{1, 2}));
    EXPECT_EQ(raw.cast_into(&values).code, etfcast::core::StatusCode::Truncated);
}

TEST(RawData, MaterialisedTermIsNotRaw) {
    const etfcast::UncastedResult result(etfcast::wire::Term::small_integer(1));
    etfcast::RawData raw;
    EXPECT_EQ(result.cast_into(&raw).code, etfcast::core::StatusCode::TypeMismatch);
}

TEST(RawData, RawSpanTermIsReDecoded) {
    const t::Buf bytes = t::list({t::small_int(6), t::small_int(7)});
    etfcast::core::DecodeContext ctx(etfcast::core::DecoderConfig{});
    etfcast::wire::ByteCursor cur(t::view(bytes));
    etfcast::wire::Term span;
    ASSERT_EQ(etfcast::wire::decode_term(cur, etfcast::wire::DecodeMode::DeferRaw, &span, ctx).code,
              etfcast::core::StatusCode::Ok);
    ASSERT_EQ(span.kind(), etfcast::wire::TermKind::RawSpan);

    std::vector<long> values;
    ASSERT_EQ(etfcast::cast::cast_term(span, &values, ctx).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(values, (std::vector<long>{6, 7}));

    etfcast::RawData raw;
    ASSERT_EQ(etfcast::cast::cast_term(span, &raw, ctx).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(raw.bytes(), bytes);
}

TEST(UncastedResult, DeferredCastChoosesTypeLater) {
    const t::Buf in = t::versioned(t::list({t::binary("a"), t::binary("b")}));
    etfcast::UncastedResult deferred;
    ASSERT_EQ(etfcast::unpack(t::view(in), &deferred).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(deferred.term().kind(), etfcast::wire::TermKind::List);

    std::vector<std::string> strings;
    ASSERT_EQ(deferred.cast_into(&strings).code, etfcast::core::StatusCode::Ok);
    EXPECT_EQ(strings, (std::vector<std::string>{"a", "b"}));

    std::vector<int> ints;
    EXPECT_EQ(deferred.cast_into(&ints).code, etfcast::core::StatusCode::TypeMismatch);
}
