#include <gtest/gtest.h>
#include "menukit/host/document.hpp"
#include <vector>

namespace openflow::menukit::host::test {

class DocumentTest : public ::testing::Test {
protected:
    Document document;
    std::vector<int> calls;
};

TEST_F(DocumentTest, DispatchRunsListenersInRegistrationOrder) {
    document.add_pointer_down_listener([this](PointerEvent&) { calls.push_back(1); });
    document.add_pointer_down_listener([this](PointerEvent&) { calls.push_back(2); });

    PointerEvent event;
    document.dispatch_pointer_down(event);

    EXPECT_EQ(calls, (std::vector<int>{1, 2}));
}

TEST_F(DocumentTest, PointerAndKeyListenersAreSeparate) {
    document.add_pointer_down_listener([this](PointerEvent&) { calls.push_back(1); });
    document.add_key_down_listener([this](KeyEvent&) { calls.push_back(2); });

    KeyEvent key;
    key.key = Key::Escape;
    document.dispatch_key_down(key);

    EXPECT_EQ(calls, (std::vector<int>{2}));
    EXPECT_EQ(document.pointer_listener_count(), 1u);
    EXPECT_EQ(document.key_listener_count(), 1u);
}

TEST_F(DocumentTest, RemoveListener) {
    ListenerId id = document.add_key_down_listener([this](KeyEvent&) { calls.push_back(1); });
    EXPECT_TRUE(document.has_listener(id));

    ASSERT_TRUE(document.remove_listener(id).has_value());
    EXPECT_FALSE(document.has_listener(id));

    KeyEvent key;
    document.dispatch_key_down(key);
    EXPECT_TRUE(calls.empty());

    auto again = document.remove_listener(id);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code(), ErrorCode::LISTENER_NOT_FOUND);
}

TEST_F(DocumentTest, ListenerRemovedDuringDispatchIsSkipped) {
    ListenerId second = INVALID_LISTENER;
    document.add_pointer_down_listener([this, &second](PointerEvent&) {
        calls.push_back(1);
        ASSERT_TRUE(document.remove_listener(second).has_value());
    });
    second = document.add_pointer_down_listener([this](PointerEvent&) { calls.push_back(2); });

    PointerEvent event;
    document.dispatch_pointer_down(event);

    EXPECT_EQ(calls, (std::vector<int>{1}));
}

TEST_F(DocumentTest, ListenerCanRemoveItself) {
    ListenerId self = INVALID_LISTENER;
    self = document.add_key_down_listener([this, &self](KeyEvent&) {
        calls.push_back(1);
        ASSERT_TRUE(document.remove_listener(self).has_value());
    });

    KeyEvent key;
    document.dispatch_key_down(key);
    document.dispatch_key_down(key);

    EXPECT_EQ(calls, (std::vector<int>{1}));
    EXPECT_EQ(document.key_listener_count(), 0u);
}

TEST_F(DocumentTest, ListenerAddedDuringDispatchWaitsForNextEvent) {
    document.add_pointer_down_listener([this](PointerEvent&) {
        calls.push_back(1);
        if (calls.size() == 1) {
            document.add_pointer_down_listener([this](PointerEvent&) { calls.push_back(2); });
        }
    });

    PointerEvent event;
    document.dispatch_pointer_down(event);
    EXPECT_EQ(calls, (std::vector<int>{1}));

    document.dispatch_pointer_down(event);
    EXPECT_EQ(calls, (std::vector<int>{1, 1, 2}));
}

TEST_F(DocumentTest, PreventDefaultIsVisibleToCaller) {
    document.add_key_down_listener([](KeyEvent& event) { event.prevent_default(); });

    KeyEvent key;
    key.key = Key::ArrowDown;
    document.dispatch_key_down(key);

    EXPECT_TRUE(key.default_prevented);
}

TEST_F(DocumentTest, KeyNames) {
    EXPECT_EQ(key_from_name("ArrowDown"), Key::ArrowDown);
    EXPECT_EQ(key_from_name(" "), Key::Space);
    EXPECT_EQ(key_from_name("Spacebar"), Key::Space);
    EXPECT_EQ(key_from_name("Escape"), Key::Escape);
    EXPECT_EQ(key_from_name("F5"), Key::Other);

    EXPECT_STREQ(key_name(Key::Tab), "Tab");
    EXPECT_STREQ(key_name(Key::Space), " ");
    EXPECT_STREQ(key_name(Key::Other), "Unidentified");
}

}  // namespace openflow::menukit::host::test
