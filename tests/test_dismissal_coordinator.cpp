#include <gtest/gtest.h>
#include "menukit/gui/dismissal_coordinator.hpp"
#include "menukit/host/document.hpp"
#include "menukit/host/element_tree.hpp"
#include "menukit/host/task_scheduler.hpp"
#include <vector>

namespace openflow::menukit::gui::test {

class DismissalCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = tree.create_element(INVALID_ELEMENT, "document").value();
        outside = tree.create_element(root, "outside").value();
        popup = tree.create_element(root, "popup").value();
        row = tree.create_element(popup, "row").value();
    }

    DismissalCoordinator::Callbacks callbacks() {
        return DismissalCoordinator::Callbacks{
            [this](DismissReason reason) { dismissals.push_back(reason); },
            [this](host::KeyEvent& event) {
                forwarded.push_back(event.key);
                return true;
            }};
    }

    void pointer_down(ElementId target) {
        host::PointerEvent event;
        event.target = target;
        document.dispatch_pointer_down(event);
    }

    host::KeyEvent key_down(host::Key key, ElementId target) {
        host::KeyEvent event;
        event.key = key;
        event.target = target;
        document.dispatch_key_down(event);
        return event;
    }

    host::ElementTree tree;
    host::Document document;
    host::ManualTaskScheduler scheduler;
    DismissalCoordinator coordinator{document, scheduler, tree};

    ElementId root = INVALID_ELEMENT;
    ElementId outside = INVALID_ELEMENT;
    ElementId popup = INVALID_ELEMENT;
    ElementId row = INVALID_ELEMENT;

    std::vector<DismissReason> dismissals;
    std::vector<host::Key> forwarded;
};

TEST_F(DismissalCoordinatorTest, PointerListenerAttachesOneTickLater) {
    coordinator.arm(1, popup, callbacks());

    EXPECT_TRUE(coordinator.is_armed());
    EXPECT_TRUE(coordinator.key_listener_attached());
    EXPECT_TRUE(coordinator.attach_pending());
    EXPECT_FALSE(coordinator.pointer_listener_attached());

    // The press that opened the popup arrives before the attach
    pointer_down(outside);
    EXPECT_TRUE(dismissals.empty());

    scheduler.run_pending();
    EXPECT_TRUE(coordinator.pointer_listener_attached());
    EXPECT_FALSE(coordinator.attach_pending());

    pointer_down(outside);
    ASSERT_EQ(dismissals.size(), 1u);
    EXPECT_EQ(dismissals[0], DismissReason::PointerOutside);
}

TEST_F(DismissalCoordinatorTest, PointerInsidePopupIsIgnored) {
    coordinator.arm(1, popup, callbacks());
    scheduler.run_pending();

    pointer_down(row);
    pointer_down(popup);

    EXPECT_TRUE(dismissals.empty());
}

TEST_F(DismissalCoordinatorTest, PointerOnNothingCountsAsOutside) {
    coordinator.arm(1, popup, callbacks());
    scheduler.run_pending();

    pointer_down(INVALID_ELEMENT);

    ASSERT_EQ(dismissals.size(), 1u);
}

TEST_F(DismissalCoordinatorTest, DisarmRemovesListenersAndCancelsAttach) {
    coordinator.arm(1, popup, callbacks());
    coordinator.disarm();

    EXPECT_FALSE(coordinator.is_armed());
    EXPECT_FALSE(coordinator.attach_pending());
    EXPECT_EQ(document.key_listener_count(), 0u);
    EXPECT_EQ(scheduler.pending_count(), 0u);

    scheduler.run_pending();
    EXPECT_EQ(document.pointer_listener_count(), 0u);

    pointer_down(outside);
    key_down(host::Key::Escape, outside);
    EXPECT_TRUE(dismissals.empty());
}

TEST_F(DismissalCoordinatorTest, RearmingReplacesPreviousSession) {
    coordinator.arm(1, popup, callbacks());
    scheduler.run_pending();
    coordinator.arm(2, popup, callbacks());

    EXPECT_EQ(coordinator.session(), 2u);
    EXPECT_EQ(document.key_listener_count(), 1u);
    EXPECT_EQ(document.pointer_listener_count(), 0u);

    scheduler.run_pending();
    EXPECT_EQ(document.pointer_listener_count(), 1u);

    pointer_down(outside);
    EXPECT_EQ(dismissals.size(), 1u);
}

TEST_F(DismissalCoordinatorTest, EscapeOutsidePopupDismisses) {
    coordinator.arm(1, popup, callbacks());

    auto event = key_down(host::Key::Escape, outside);

    ASSERT_EQ(dismissals.size(), 1u);
    EXPECT_EQ(dismissals[0], DismissReason::EscapeKey);
    EXPECT_TRUE(event.default_prevented);
}

TEST_F(DismissalCoordinatorTest, TabOutsidePopupDismissesWithoutPreventingDefault) {
    coordinator.arm(1, popup, callbacks());

    auto event = key_down(host::Key::Tab, outside);

    ASSERT_EQ(dismissals.size(), 1u);
    EXPECT_EQ(dismissals[0], DismissReason::TabKey);
    EXPECT_FALSE(event.default_prevented);
}

TEST_F(DismissalCoordinatorTest, TabIgnoredWhenDisabled) {
    coordinator.set_close_on_tab(false);
    coordinator.arm(1, popup, callbacks());

    key_down(host::Key::Tab, outside);

    EXPECT_TRUE(dismissals.empty());
}

TEST_F(DismissalCoordinatorTest, KeysInsidePopupAreForwarded) {
    coordinator.arm(1, popup, callbacks());

    key_down(host::Key::ArrowDown, popup);
    key_down(host::Key::Escape, row);

    EXPECT_EQ(forwarded, (std::vector<host::Key>{host::Key::ArrowDown, host::Key::Escape}));
    EXPECT_TRUE(dismissals.empty());
}

TEST_F(DismissalCoordinatorTest, OtherKeysOutsideAreIgnored) {
    coordinator.arm(1, popup, callbacks());

    key_down(host::Key::ArrowDown, outside);
    key_down(host::Key::Other, outside);

    EXPECT_TRUE(dismissals.empty());
    EXPECT_TRUE(forwarded.empty());
}

TEST_F(DismissalCoordinatorTest, DismissHandlerMayDisarm) {
    coordinator.arm(1, popup, DismissalCoordinator::Callbacks{
        [this](DismissReason reason) {
            dismissals.push_back(reason);
            coordinator.disarm();
        },
        nullptr});
    scheduler.run_pending();

    pointer_down(outside);
    pointer_down(outside);

    EXPECT_EQ(dismissals.size(), 1u);
    EXPECT_EQ(document.pointer_listener_count(), 0u);
    EXPECT_EQ(document.key_listener_count(), 0u);
}

TEST_F(DismissalCoordinatorTest, DestructionDetachesListeners) {
    {
        DismissalCoordinator scoped(document, scheduler, tree);
        scoped.arm(7, popup, callbacks());
        scheduler.run_pending();
        EXPECT_EQ(document.pointer_listener_count(), 1u);
    }
    EXPECT_EQ(document.pointer_listener_count(), 0u);
    EXPECT_EQ(document.key_listener_count(), 0u);
}

TEST(DismissReasonTest, Names) {
    EXPECT_STREQ(dismiss_reason_to_string(DismissReason::PointerOutside), "pointer-outside");
    EXPECT_STREQ(dismiss_reason_to_string(DismissReason::Programmatic), "programmatic");
}

}  // namespace openflow::menukit::gui::test
