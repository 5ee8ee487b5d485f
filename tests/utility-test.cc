#include <soa-core/utility.hh>

#include <nexus/test.hh>

#include <limits>
#include <type_traits>

static_assert(soa::is_power_of_two(1));
static_assert(soa::is_power_of_two(64));
static_assert(!soa::is_power_of_two(12));
static_assert(soa::align_up(soa::isize(20), 8) == 24);
static_assert(soa::align_up(soa::isize(24), 8) == 24);
static_assert(soa::is_aligned(soa::isize(48), 16));
static_assert(std::is_same_v<soa::function_ptr<int(float, char)>, int (*)(float, char)>);

TEST("utility - move, forward, exchange")
{
    int a = 1;
    int b = soa::exchange(a, 5);
    CHECK(a == 5);
    CHECK(b == 1);

    CHECK(soa::max(3, 7) == 7);
    CHECK(soa::min(3, 7) == 3);
    CHECK(soa::max(soa::isize(-1), soa::isize(-2)) == -1);
}

TEST("utility - checked size arithmetic")
{
    constexpr auto max = std::numeric_limits<soa::isize>::max();
    soa::isize out = -1;

    SECTION("multiplication")
    {
        CHECK(soa::try_mul_size(6, 7, out));
        CHECK(out == 42);

        CHECK(soa::try_mul_size(max, 0, out));
        CHECK(out == 0);

        CHECK(soa::try_mul_size(max, 1, out));
        CHECK(out == max);

        CHECK(!soa::try_mul_size(max / 2 + 1, 2, out));
        CHECK(!soa::try_mul_size(max, max, out));
    }

    SECTION("addition")
    {
        CHECK(soa::try_add_size(max - 1, 1, out));
        CHECK(out == max);
        CHECK(!soa::try_add_size(max, 1, out));
    }

    SECTION("alignment")
    {
        CHECK(soa::try_align_up_size(13, 4, out));
        CHECK(out == 16);
        CHECK(soa::try_align_up_size(0, 8, out));
        CHECK(out == 0);
        CHECK(!soa::try_align_up_size(max - 2, 8, out));
    }
}

TEST("utility - raw memory")
{
    int src[] = {1, 2, 3, 4, 5};
    int dst[5] = {};

    soa::memcpy(dst, src, sizeof(src));
    CHECK(dst[4] == 5);

    // overlapping move towards the end
    soa::memmove(src + 1, src, 4 * soa::isize(sizeof(int)));
    CHECK(src[0] == 1);
    CHECK(src[1] == 1);
    CHECK(src[4] == 4);

    // zero sizes accept null pointers
    soa::memcpy(nullptr, nullptr, 0);
    soa::memmove(nullptr, nullptr, 0);

    alignas(double) soa::byte buffer[sizeof(double)];
    auto* d = new (soa::placement_new, buffer) double(2.5);
    CHECK(*d == 2.5);
}
