#include "test_common.hpp"
#include "arg_parser.hpp"

TEST_CASE("ArgParser basic parsing") {
    const char* argv[] = {"prog", "--foo", "--opt", "42", "pos", "--unknown"};
    ArgParser parser(6, const_cast<char**>(argv), {"--foo", "--bar", "--opt"}, {}, {"--foo"});
    REQUIRE(parser.has_flag("--foo"));
    REQUIRE(parser.get_option("--opt") == "42");
    REQUIRE(parser.positional().size() == 1);
    REQUIRE(parser.positional()[0] == "pos");
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "--unknown");
}

TEST_CASE("ArgParser option with equals") {
    const char* argv[] = {"prog", "--opt=val"};
    ArgParser parser(2, const_cast<char**>(argv), {"--opt"});
    REQUIRE(parser.has_flag("--opt"));
    REQUIRE(parser.get_option("--opt") == "val");
}

TEST_CASE("ArgParser short options") {
    const char* argv[] = {"prog", "-h", "-o42"};
    ArgParser parser(3, const_cast<char**>(argv), {"--help", "--opt"},
                     {{'h', "--help"}, {'o', "--opt"}}, {"--help"});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_option("--opt") == std::string("42"));
}

TEST_CASE("ArgParser stacked short flags") {
    const char* argv[] = {"prog", "-abc"};
    ArgParser parser(2, const_cast<char**>(argv), {"--flag-a", "--flag-b", "--flag-c"},
                     {{'a', "--flag-a"}, {'b', "--flag-b"}, {'c', "--flag-c"}},
                     {"--flag-a", "--flag-b", "--flag-c"});
    REQUIRE(parser.has_flag("--flag-a"));
    REQUIRE(parser.has_flag("--flag-b"));
    REQUIRE(parser.has_flag("--flag-c"));
}

TEST_CASE("ArgParser unknown flag detection") {
    const char* argv[] = {"prog", "--foo"};
    ArgParser parser(2, const_cast<char**>(argv), {"--bar"});
    REQUIRE_FALSE(parser.has_flag("--foo"));
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "--foo");
}

TEST_CASE("ArgParser unknown short flag") {
    const char* argv[] = {"prog", "-x"};
    ArgParser parser(2, const_cast<char**>(argv), {"--bar"}, {{'a', "--bar"}});
    REQUIRE(parser.positional().empty());
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "-x");
}

TEST_CASE("ArgParser switches never consume the next argument") {
    const char* argv[] = {"prog", "delete", "--force", "demo", "-y", "other"};
    ArgParser parser(6, const_cast<char**>(argv), {"--force", "--yes"}, {{'y', "--yes"}},
                     {"--force", "--yes"});
    REQUIRE(parser.has_flag("--force"));
    REQUIRE(parser.has_flag("--yes"));
    REQUIRE_FALSE(parser.has_value("--force"));
    REQUIRE(parser.positional() == std::vector<std::string>{"delete", "demo", "other"});
}

TEST_CASE("ArgParser repeatable option keeps every value") {
    const char* argv[] = {"prog", "create", "demo", "-r", "backend:main", "--repo",
                          "frontend:feature/x", "-rdocs:main"};
    ArgParser parser(8, const_cast<char**>(argv), {"--repo"}, {{'r', "--repo"}});
    auto repos = parser.get_all_options("--repo");
    REQUIRE(repos == std::vector<std::string>{"backend:main", "frontend:feature/x", "docs:main"});
    REQUIRE(parser.get_option("--repo") == "docs:main");
    REQUIRE(parser.positional() == std::vector<std::string>{"create", "demo"});
}

TEST_CASE("ArgParser double dash ends option parsing") {
    const char* argv[] = {"prog", "path", "--", "--weird"};
    ArgParser parser(4, const_cast<char**>(argv), {"--help"});
    REQUIRE(parser.unknown_flags().empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"path", "--weird"});
}

TEST_CASE("ArgParser value option without value is a bare flag") {
    const char* argv[] = {"prog", "--log-level"};
    ArgParser parser(2, const_cast<char**>(argv), {"--log-level"});
    REQUIRE(parser.has_flag("--log-level"));
    REQUIRE_FALSE(parser.has_value("--log-level"));
    REQUIRE(parser.get_option("--log-level").empty());
}
