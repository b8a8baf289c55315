#include "vector.hpp"
#include "expected.hpp"
#include "optional.hpp"
#include "stdio.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>

TEST(memory, vector) {
	kstd::vector<int> vec {};
	auto count = rand() % 2000 + 1;
	for (int i = 0; i < count; ++i) {
		vec.push(int {i});
	}
	EXPECT_EQ(vec.size(), static_cast<size_t>(count));
	EXPECT_GE(vec.capacity(), vec.size());

	int expected = 0;
	for (auto value : vec) {
		EXPECT_EQ(value, expected++);
	}
	EXPECT_EQ(expected, count);

	vec.clear();
	EXPECT_EQ(vec.size(), 0);
	EXPECT_GE(vec.capacity(), static_cast<size_t>(count));
}

TEST(memory, vector_try_reserve) {
	kstd::vector<u64> vec {};
	ASSERT_TRUE(vec.try_reserve(1));
	auto cap = vec.capacity();
	EXPECT_GE(cap, 1);
	for (usize i = 0; i < cap; ++i) {
		vec.push(u64 {i});
	}
	EXPECT_EQ(vec.capacity(), cap);

	kstd::vector<u64> moved {std::move(vec)};
	EXPECT_EQ(moved.size(), cap);
	EXPECT_EQ(vec.size(), 0);
	EXPECT_EQ(vec.capacity(), 0);
}

TEST(memory, vector_try_reserve_exhausted) {
	kstd::vector<u64> vec {};
	ALLOCATOR.fail_after(0);
	bool reserved = vec.try_reserve(1);
	ALLOCATOR.clear_limit();
	EXPECT_FALSE(reserved);
	EXPECT_EQ(vec.size(), 0);
	EXPECT_EQ(vec.capacity(), 0);

	ASSERT_TRUE(vec.try_reserve(1));
	vec.push(u64 {7});
	auto cap = vec.capacity();

	// growing past the capacity needs a new buffer, the old one stays intact
	ALLOCATOR.fail_after(0);
	reserved = vec.try_reserve(cap);
	ALLOCATOR.clear_limit();
	EXPECT_FALSE(reserved);
	EXPECT_EQ(vec.capacity(), cap);
	ASSERT_EQ(vec.size(), 1);
	EXPECT_EQ(*vec.begin(), 7);
}

namespace {
	enum class Error {
		Bad
	};

	kstd::expected<int, Error> parse(bool ok) {
		if (!ok) {
			return Error::Bad;
		}
		return 42;
	}

	kstd::expected<void, Error> check(bool ok) {
		if (!ok) {
			return kstd::unexpected<Error> {Error::Bad};
		}
		return {};
	}
}

TEST(utility, expected) {
	auto good = parse(true);
	ASSERT_TRUE(good.has_value());
	EXPECT_EQ(good.value(), 42);

	auto bad = parse(false);
	ASSERT_FALSE(bad);
	EXPECT_EQ(bad.error(), Error::Bad);

	EXPECT_TRUE(check(true).has_value());
	EXPECT_EQ(check(false).error(), Error::Bad);
}

TEST(utility, optional) {
	kstd::optional<u64> empty {};
	EXPECT_FALSE(empty.has_value());
	EXPECT_EQ(empty.value_or(7), 7);

	kstd::optional<u64> value {u64 {5}};
	kstd::optional<u64> copy {value};
	ASSERT_TRUE(copy.has_value());
	EXPECT_EQ(*copy, 5);

	kstd::optional<u64> moved {std::move(value)};
	EXPECT_EQ(*moved, 5);
	EXPECT_FALSE(value.has_value());
}

namespace {
	struct StringSink : public LogSink {
		void write(kstd::string_view str) override {
			out.append(str.data(), str.size());
		}

		std::string out;
	};
}

TEST(log, sinks_and_replay) {
	auto log = std::make_unique<Log>();
	StringSink early {};
	log->register_sink(&early);

	*log << kstd::string_view {"value "} << Fmt::Hex << zero_pad(4) << usize {0xAB} << Fmt::Reset
		<< kstd::string_view {" "} << usize {10};
	EXPECT_EQ(early.out, "value 00AB 10");

	StringSink late {};
	log->register_sink(&late);
	EXPECT_EQ(late.out, "value 00AB 10");

	log->unregister_sink(&early);
	*log << Fmt::Bin << usize {5};
	EXPECT_EQ(early.out, "value 00AB 10");
	EXPECT_EQ(late.out, "value 00AB 10101");
	log->unregister_sink(&late);
}
