#include "test_helpers.hpp"

#include <string>

using namespace lexiclean;

TEST_CASE("kind_of reports each alternative") {
    CHECK(kind_of(root_dir()) == ComponentKind::RootDir);
    CHECK(kind_of(prefix("C:")) == ComponentKind::Prefix);
    CHECK(kind_of(cur_dir()) == ComponentKind::CurDir);
    CHECK(kind_of(parent_dir()) == ComponentKind::ParentDir);
    CHECK(kind_of(normal("foo")) == ComponentKind::Normal);
}

TEST_CASE("kind_to_string uses snake_case names") {
    CHECK(std::string(kind_to_string(ComponentKind::RootDir)) == "root_dir");
    CHECK(std::string(kind_to_string(ComponentKind::Prefix)) == "prefix");
    CHECK(std::string(kind_to_string(ComponentKind::CurDir)) == "cur_dir");
    CHECK(std::string(kind_to_string(ComponentKind::ParentDir)) == "parent_dir");
    CHECK(std::string(kind_to_string(ComponentKind::Normal)) == "normal");
}

TEST_CASE("component equality compares kind and payload") {
    CHECK(normal("a") == normal("a"));
    CHECK(normal("a") != normal("b"));
    CHECK(prefix("C:") == prefix("C:"));
    CHECK(prefix("C:") != prefix("D:"));
    CHECK(root_dir() == root_dir());
    CHECK(cur_dir() != parent_dir());
    // Same text, different kind
    CHECK(normal("C:") != prefix("C:"));
    CHECK(normal(".") != cur_dir());
}

TEST_CASE("is_anchor") {
    CHECK(is_anchor(root_dir()));
    CHECK(is_anchor(prefix("\\\\?\\C:")));
    CHECK_FALSE(is_anchor(cur_dir()));
    CHECK_FALSE(is_anchor(parent_dir()));
    CHECK_FALSE(is_anchor(normal("foo")));
}

TEST_CASE("to_string gives the component text") {
    CHECK(to_string(root_dir()).empty());
    CHECK(to_string(prefix("C:")) == "C:");
    CHECK(to_string(cur_dir()) == ".");
    CHECK(to_string(parent_dir()) == "..");
    CHECK(to_string(normal("foo.txt")) == "foo.txt");
}

TEST_CASE("describe renders a debug form") {
    CHECK(describe(Path{}) == "[]");
    CHECK(describe({root_dir(), normal("foo"), parent_dir()}) ==
          "[root_dir, normal(\"foo\"), parent_dir]");
    CHECK(describe({prefix("C:"), cur_dir()}) == "[prefix(\"C:\"), cur_dir]");
}
