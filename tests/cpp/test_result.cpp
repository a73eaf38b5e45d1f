#include <gtest/gtest.h>
#include "ninep/Int.hpp"
#include "ninep/Qid.hpp"
#include "ninep/Result.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace ninep;

TEST(Result, SuccessHoldsValue) {
    Result<int> r(42);
    EXPECT_TRUE(r.ok());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
    EXPECT_THROW(r.error(), std::logic_error);
}

TEST(Result, FailureHoldsError) {
    Result<int> r(MalformedInput("Int32.read: buffer too small (0 < 4)"));
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(std::string(r.error().what()), "Int32.read: buffer too small (0 < 4)");
    EXPECT_THROW(r.value(), MalformedInput);
}

TEST(Result, AttemptCapturesMalformedInput) {
    std::vector<uint8_t> buffer = {0x01};

    auto ok = attempt([&] { return Int8::read(buffer); });
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(ok.value().value, 0x01);

    auto bad = attempt([&] { return Int16::read(buffer); });
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(std::string(bad.error().what()), "Int16.read: buffer too small (1 < 2)");
}

TEST(Result, AttemptDoesNotCaptureOtherExceptions) {
    EXPECT_THROW(
        attempt([]() -> int { throw std::out_of_range("not a codec error"); }),
        std::out_of_range);
}

TEST(Result, AndThenChainsOnSuccess) {
    std::vector<uint8_t> buffer = {0x34, 0x12, 0x78, 0x56, 0x34, 0x12};

    auto r = attempt([&] { return Int16::read(buffer); })
        .andThen([](const Decoded<uint16_t>& first) {
            return attempt([&] { return Int32::read(first.rest); })
                .andThen([&](const Decoded<uint32_t>& second) {
                    return Result<uint64_t>(
                        (static_cast<uint64_t>(first.value) << 32) | second.value);
                });
        });

    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value(), 0x0000123412345678ull);
}

// The first failure short-circuits and later steps never run.
TEST(Result, AndThenPropagatesFirstFailureUnchanged) {
    std::vector<uint8_t> buffer(5);
    bool qidStepRan = false;
    bool lastStepRan = false;

    auto r = attempt([&] { return Int16::read(buffer); })
        .andThen([&](const Decoded<uint16_t>& d) {
            qidStepRan = true;
            return attempt([&] { return Qid::read(d.rest); });
        })
        .andThen([&](const Decoded<Qid>&) {
            lastStepRan = true;
            return Result<int>(0);
        });

    EXPECT_TRUE(qidStepRan);
    EXPECT_FALSE(lastStepRan);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(std::string(r.error().what()), "Qid.read: buffer too small (3 < 13)");
}

TEST(Result, AndThenOnRvalueMovesValue) {
    auto r = Result<std::string>(std::string("payload"))
        .andThen([](std::string&& s) { return Result<size_t>(s.size()); });

    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value(), 7u);
}
