#include <catch2/catch_test_macros.hpp>
#include "archive/member_tree.hpp"

using namespace kmp::archive;

namespace {

MemberInfo file(std::string name, kmp::u64 size = 1) {
    MemberInfo info;
    info.stored_name = name;
    info.name = normalize_member_path(name);
    info.size = size;
    return info;
}

MemberInfo dir(std::string name) {
    auto info = file(std::move(name), 0);
    info.type = MemberType::Directory;
    return info;
}

MemberTree make_tree(std::vector<MemberInfo> members) {
    for (size_t i = 0; i < members.size(); i++) members[i].index = i;
    return MemberTree(std::move(members));
}

} // namespace

TEST_CASE("Member path normalization", "[archive]") {
    CHECK(normalize_member_path("a/b.txt") == "a/b.txt");
    CHECK(normalize_member_path("./a/b.txt") == "a/b.txt");
    CHECK(normalize_member_path("/a//b/") == "a/b");
    CHECK(normalize_member_path("a/./b/../c") == "a/c");
    CHECK(normalize_member_path("../escape") == "escape");
    CHECK(normalize_member_path(".") == "");
    CHECK(normalize_member_path("") == "");
}

TEST_CASE("Wildcard matching", "[archive]") {
    CHECK(wildcard_match("*.csv", "index.csv"));
    CHECK_FALSE(wildcard_match("*.csv", "index.csv.bak"));
    CHECK(wildcard_match("*", ""));
    CHECK(wildcard_match("a?c", "abc"));
    CHECK_FALSE(wildcard_match("a?c", "ac"));
    CHECK(wildcard_match("file[0-9].txt", "file7.txt"));
    CHECK_FALSE(wildcard_match("file[!0-9].txt", "file7.txt"));
    CHECK(wildcard_match("file[!0-9].txt", "fileX.txt"));
    CHECK(wildcard_match("*a*b*", "xxaxxbxx"));
    CHECK(wildcard_match("[abc]", "b"));
    CHECK(wildcard_match("x[", "x["));
    CHECK_FALSE(wildcard_match("abc", "abd"));
}

TEST_CASE("Member tree lookup with implied directories", "[archive]") {
    auto tree = make_tree({file("a/b.txt"), file("a/c/d.txt"), file("top.txt")});

    CHECK(tree.lookup("").type == MemberTree::EntryType::Directory);
    CHECK(tree.lookup("a").type == MemberTree::EntryType::Directory);
    CHECK(tree.lookup("a").member == nullptr);
    CHECK(tree.lookup("a/c").type == MemberTree::EntryType::Directory);
    CHECK(tree.lookup("a/b.txt").type == MemberTree::EntryType::File);
    CHECK(tree.lookup("top.txt").member->name == "top.txt");
    CHECK(tree.lookup("a/b").type == MemberTree::EntryType::Missing);
    CHECK(tree.lookup("b.txt").type == MemberTree::EntryType::Missing);
}

TEST_CASE("Member tree listings keep stored order", "[archive]") {
    auto tree = make_tree({file("z.txt"), dir("m/"), file("m/2.txt"),
                           file("a/1.txt"), file("m/1.txt")});

    CHECK(tree.children("") == std::vector<std::string>{"z.txt", "m", "a"});
    CHECK(tree.children("m") == std::vector<std::string>{"m/2.txt", "m/1.txt"});
    CHECK(tree.children("z.txt").empty());
    CHECK(tree.descendants("") ==
          std::vector<std::string>{"z.txt", "m", "m/2.txt", "a", "a/1.txt", "m/1.txt"});
}

TEST_CASE("Sole top-level file", "[archive]") {
    CHECK(make_tree({file("only.txt")}).sole_top_level_file() != nullptr);
    CHECK(make_tree({file("dir/only.txt")}).sole_top_level_file() == nullptr);
    CHECK(make_tree({file("a.txt"), file("b.txt")}).sole_top_level_file() == nullptr);
    CHECK(make_tree({}).sole_top_level_file() == nullptr);

    auto other = file("link");
    other.type = MemberType::Other;
    CHECK(make_tree({other}).sole_top_level_file() == nullptr);
}

TEST_CASE("Duplicate member names resolve to the last entry", "[archive]") {
    auto tree = make_tree({file("data.txt", 3), file("./data.txt", 9)});

    auto entry = tree.lookup("data.txt");
    REQUIRE(entry.type == MemberTree::EntryType::File);
    CHECK(entry.member->size == 9);
    CHECK(entry.member->index == 1);
    CHECK(tree.children("") == std::vector<std::string>{"data.txt"});
    REQUIRE(tree.sole_top_level_file() != nullptr);
    CHECK(tree.sole_top_level_file()->index == 1);
}
