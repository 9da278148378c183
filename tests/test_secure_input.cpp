#include <catch2/catch.hpp>

#include "fake_bridge.hpp"
#include "secure_input.hpp"

#include <string>

TEST_CASE("app_name_from_path", "[secure_input]") {

    SECTION("AppBundle") {
        auto name = SecureInputResolver::app_name_from_path(
            "/Applications/iTerm.app/Contents/MacOS/iTerm2");
        REQUIRE(name.has_value());
        REQUIRE(*name == "iTerm");
    }

    SECTION("NoBundle") {
        REQUIRE_FALSE(SecureInputResolver::app_name_from_path("/another/directory").has_value());
    }

    SECTION("ServiceBundle") {
        auto name = SecureInputResolver::app_name_from_path(
            "/System/Library/Frameworks/Security.framework/Versions/A/MachServices/"
            "SecurityAgent.bundle/Contents/MacOS/SecurityAgent");
        REQUIRE(name.has_value());
        REQUIRE(*name == "SecurityAgent");
    }

    SECTION("DotsInsideName") {
        auto name = SecureInputResolver::app_name_from_path(
            "/Applications/Visual Studio Code.app/Contents/MacOS/Electron");
        REQUIRE(*name == "Visual Studio Code");

        auto dotted = SecureInputResolver::app_name_from_path("/opt/My.Tool.app/bin");
        REQUIRE(*dotted == "My.Tool");
    }

    SECTION("OutermostBundleWins") {
        auto name = SecureInputResolver::app_name_from_path(
            "/Applications/Outer.app/Contents/Helpers/Inner.app/Contents/MacOS/Inner");
        REQUIRE(*name == "Outer");
    }

    SECTION("SuffixNeedsTrailingSeparator") {
        REQUIRE_FALSE(SecureInputResolver::app_name_from_path("/Applications/iTerm.app").has_value());
        REQUIRE_FALSE(SecureInputResolver::app_name_from_path("iTerm.app/Contents").has_value());
    }

    SECTION("OtherSuffixesIgnored") {
        REQUIRE_FALSE(
            SecureInputResolver::app_name_from_path("/Library/Foo.framework/Foo").has_value());
        REQUIRE_FALSE(SecureInputResolver::app_name_from_path("/opt/iTermXapp/bin").has_value());
    }
}

TEST_CASE("SecureInputResolver", "[secure_input]") {
    FakeBridge bridge;
    SecureInputResolver resolver(bridge);

    SECTION("NoHolder") {
        bridge.pid_status = 0;
        REQUIRE_FALSE(resolver.holder_pid().has_value());
        REQUIRE_FALSE(resolver.get_secure_input_holder().has_value());
    }

    SECTION("FailedPidQueryIgnoresGarbagePid") {
        bridge.pid_status = -1;
        bridge.pid_value = 4242;
        bridge.path = {.status = 10, .value = "/bin/login"};
        REQUIRE_FALSE(resolver.holder_pid().has_value());
        REQUIRE_FALSE(resolver.get_secure_input_holder().has_value());
        REQUIRE(bridge.last_path_pid == 0);
    }

    SECTION("SentinelPidIsNotAHolder") {
        bridge.pid_status = 1;
        bridge.pid_value = -1;
        REQUIRE_FALSE(resolver.get_secure_input_holder().has_value());
    }

    SECTION("HolderInsideAppBundle") {
        bridge.pid_status = 1;
        bridge.pid_value = 812;
        bridge.path = {.status = 44, .value = "/Applications/iTerm.app/Contents/MacOS/iTerm2"};

        auto holder = resolver.get_secure_input_holder();
        REQUIRE(holder.has_value());
        REQUIRE(holder->name == "iTerm");
        REQUIRE(holder->path == "/Applications/iTerm.app/Contents/MacOS/iTerm2");
        REQUIRE(bridge.last_path_pid == 812);
        REQUIRE(bridge.last_capacity == 4096);
    }

    SECTION("FallsBackToPath") {
        bridge.pid_status = 1;
        bridge.pid_value = 77;
        bridge.path = {.status = 18, .value = "/another/directory"};

        auto holder = resolver.get_secure_input_holder();
        REQUIRE(holder.has_value());
        REQUIRE(holder->name == "/another/directory");
        REQUIRE(holder->path == "/another/directory");
    }

    SECTION("PathIsTrimmed") {
        bridge.pid_status = 1;
        bridge.pid_value = 77;
        bridge.path = {.status = 22, .value = "  /usr/libexec/agent\n"};

        auto holder = resolver.get_secure_input_holder();
        REQUIRE(holder.has_value());
        REQUIRE(holder->path == "/usr/libexec/agent");
        REQUIRE(holder->name == "/usr/libexec/agent");
    }

    SECTION("NameIsTakenFromTrimmedPath") {
        bridge.pid_status = 1;
        bridge.pid_value = 812;
        bridge.path = {.status = 48, .value = "  /Applications/iTerm.app/Contents/MacOS/iTerm2\n"};

        auto holder = resolver.get_secure_input_holder();
        REQUIRE(holder.has_value());
        REQUIRE(holder->name == "iTerm");
        REQUIRE(holder->path == "/Applications/iTerm.app/Contents/MacOS/iTerm2");
    }

    SECTION("UnicodeWhitespaceIsTrimmed") {
        bridge.pid_status = 1;
        bridge.pid_value = 77;
        bridge.path = {.status = 24, .value = "\xc2\xa0/usr/libexec/agent\xe2\x80\xa8"};

        auto holder = resolver.get_secure_input_holder();
        REQUIRE(holder.has_value());
        REQUIRE(holder->path == "/usr/libexec/agent");
    }

    SECTION("NoBreakSpaceOnlyPathIsNotAHolder") {
        bridge.pid_status = 1;
        bridge.pid_value = 77;
        bridge.path = {.status = 2, .value = "\xc2\xa0"};
        REQUIRE_FALSE(resolver.get_secure_input_holder().has_value());
    }

    SECTION("TruncatedPathIsNotAHolder") {
        bridge.pid_status = 1;
        bridge.pid_value = 77;
        bridge.path = {.status = 4095, .value = "/" + std::string(4095, 'a')};
        REQUIRE_FALSE(resolver.get_secure_input_holder().has_value());
        REQUIRE(bridge.last_capacity == 4096);
    }

    SECTION("BlankPathIsNotAHolder") {
        bridge.pid_status = 1;
        bridge.pid_value = 77;
        bridge.path = {.status = 3, .value = " \t "};
        REQUIRE_FALSE(resolver.get_secure_input_holder().has_value());
    }

    SECTION("UnresolvablePathIsNotAHolder") {
        bridge.pid_status = 1;
        bridge.pid_value = 77;
        bridge.path = {.status = 0, .value = ""};
        REQUIRE_FALSE(resolver.get_secure_input_holder().has_value());
    }

    SECTION("RepeatedQueriesAgree") {
        bridge.pid_status = 1;
        bridge.pid_value = 812;
        bridge.path = {.status = 44, .value = "/Applications/iTerm.app/Contents/MacOS/iTerm2"};

        auto first = resolver.get_secure_input_holder();
        auto second = resolver.get_secure_input_holder();
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(first->name == second->name);
        REQUIRE(first->path == second->path);

        bridge.pid_status = 0;
        REQUIRE(resolver.get_secure_input_holder().has_value() ==
                resolver.get_secure_input_holder().has_value());
    }

    SECTION("EachCallQueriesAgain") {
        bridge.pid_status = 1;
        bridge.pid_value = 812;
        bridge.path = {.status = 44, .value = "/Applications/iTerm.app/Contents/MacOS/iTerm2"};
        auto first = resolver.get_secure_input_holder();

        bridge.pid_status = 0;
        auto second = resolver.get_secure_input_holder();

        REQUIRE(first.has_value());
        REQUIRE_FALSE(second.has_value());
    }
}
