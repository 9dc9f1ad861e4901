#include "core/Error.hpp"

#include <doctest/doctest.h>

#include <set>
#include <vector>

using namespace RFS;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::UnknownError);
             i <= static_cast<int>(Error::Code::CapacityExceeded);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        std::set<std::string_view> labels;
        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            labels.insert(label);
            // describeError echoes the label when the message is empty.
            Error e{code, ""};
            CHECK(describeError(e) == std::string{label});
        }
        // Every code has its own label.
        CHECK(labels.size() == codes.size());

        Error withMsg{Error::Code::InvalidPath, "relative/path"};
        CHECK(describeError(withMsg) == "invalid_path:relative/path");

        Error watcher{Error::Code::WatcherFailure, "inotify read failed"};
        CHECK(describeError(watcher) == "watcher_failure:inotify read failed");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("Expected carries either a value or an Error") {
        Expected<int> ok = 42;
        REQUIRE(ok.has_value());
        CHECK(*ok == 42);

        Expected<int> failed = std::unexpected(Error{Error::Code::Timeout, "waited too long"});
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().code == Error::Code::Timeout);
        CHECK(failed.error().message == "waited too long");
        CHECK(failed.value_or(7) == 7);
    }
}
