#include "test_helpers.hpp"
#include <lexiclean/normalize.hpp>

using namespace lexiclean;

// ============================================================================
// Per-component rules
// ============================================================================

TEST_CASE("cur_dir is always dropped") {
    CHECK(normalize({normal("a"), cur_dir(), normal("b")}) == Path{normal("a"), normal("b")});
    CHECK(normalize({root_dir(), cur_dir()}) == Path{root_dir()});
    CHECK(normalize({normal("a"), cur_dir()}) == Path{normal("a")});
}

TEST_CASE("parent_dir cancels the preceding normal") {
    CHECK(normalize({normal("a"), normal("b"), parent_dir()}) == Path{normal("a")});
    CHECK(normalize({root_dir(), normal("a"), parent_dir(), normal("b")}) ==
          Path{root_dir(), normal("b")});
}

TEST_CASE("parent_dir with nothing concrete before it is kept") {
    CHECK(normalize({parent_dir(), normal("a")}) == Path{parent_dir(), normal("a")});
    CHECK(normalize({parent_dir(), parent_dir()}) == Path{parent_dir(), parent_dir()});
    CHECK(normalize({normal("a"), parent_dir(), parent_dir()}) == Path{parent_dir()});
}

TEST_CASE("parent_dir after an anchor is absorbed") {
    CHECK(normalize({root_dir(), parent_dir()}) == Path{root_dir()});
    CHECK(normalize({root_dir(), parent_dir(), parent_dir(), normal("a")}) ==
          Path{root_dir(), normal("a")});
    CHECK(normalize({prefix("C:"), parent_dir(), normal("a")}) ==
          Path{prefix("C:"), normal("a")});
    CHECK(normalize({prefix("C:"), root_dir(), parent_dir()}) ==
          Path{prefix("C:"), root_dir()});
}

TEST_CASE("cancellation only looks at the top of the stack") {
    // a/./../b: the "." is dropped before ".." is seen
    CHECK(normalize({normal("a"), cur_dir(), parent_dir(), normal("b")}) == Path{normal("b")});
    // a/b/../../c
    CHECK(normalize({normal("a"), normal("b"), parent_dir(), parent_dir(), normal("c")}) ==
          Path{normal("c")});
    // a/../../b keeps one unresolved ".."
    CHECK(normalize({normal("a"), parent_dir(), parent_dir(), normal("b")}) ==
          Path{parent_dir(), normal("b")});
}

TEST_CASE("anchors and normals are pushed unchanged") {
    Path input{prefix("\\\\server\\share"), root_dir(), normal("x y"), normal("..."), normal(".hidden")};
    CHECK(normalize(input) == input);
}

// ============================================================================
// Empty-result policy
// ============================================================================

TEST_CASE("empty result becomes cur_dir by default") {
    CHECK(normalize(Path{}) == Path{cur_dir()});
    CHECK(normalize({normal("a"), parent_dir()}) == Path{cur_dir()});
    CHECK(normalize({cur_dir(), cur_dir(), cur_dir()}) == Path{cur_dir()});
}

TEST_CASE("preserve policy keeps the empty result empty") {
    NormalizeOptions opts;
    opts.empty = EmptyPolicy::Preserve;

    CHECK(normalize(Path{}, opts).empty());
    CHECK(normalize({normal("a"), parent_dir()}, opts).empty());
    CHECK(normalize({cur_dir(), cur_dir()}, opts).empty());
    // Non-empty results are unaffected
    CHECK(normalize({normal("a"), normal("b"), parent_dir()}, opts) == Path{normal("a")});
}

TEST_CASE("single component inputs are returned unchanged") {
    CHECK(normalize({cur_dir()}) == Path{cur_dir()});
    CHECK(normalize({parent_dir()}) == Path{parent_dir()});
    CHECK(normalize({root_dir()}) == Path{root_dir()});
    CHECK(normalize({prefix("D:")}) == Path{prefix("D:")});
    CHECK(normalize({normal("foo")}) == Path{normal("foo")});

    NormalizeOptions opts;
    opts.empty = EmptyPolicy::Preserve;
    CHECK(normalize({cur_dir()}, opts) == Path{cur_dir()});
}

// ============================================================================
// Purity
// ============================================================================

TEST_CASE("normalize does not modify its input") {
    const Path input{root_dir(), normal("a"), cur_dir(), parent_dir(), normal("b")};
    Path copy = input;
    auto out = normalize(input);
    CHECK(input == copy);
    CHECK(out == Path{root_dir(), normal("b")});
}

TEST_CASE("is_normalized") {
    CHECK(is_normalized({root_dir(), normal("a")}));
    CHECK(is_normalized({parent_dir(), parent_dir(), normal("a")}));
    CHECK(is_normalized({cur_dir()}));
    CHECK_FALSE(is_normalized({normal("a"), cur_dir()}));
    CHECK_FALSE(is_normalized({normal("a"), parent_dir()}));
    CHECK_FALSE(is_normalized({root_dir(), parent_dir()}));
    CHECK_FALSE(is_normalized(Path{}));

    NormalizeOptions opts;
    opts.empty = EmptyPolicy::Preserve;
    CHECK(is_normalized(Path{}, opts));
}
