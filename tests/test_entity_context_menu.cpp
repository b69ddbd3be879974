#include <gtest/gtest.h>
#include "menukit/gui/entity_context_menu.hpp"
#include "menukit/host/document.hpp"
#include "menukit/host/element_tree.hpp"
#include "menukit/host/task_scheduler.hpp"
#include <memory>
#include <string>
#include <vector>

namespace openflow::menukit::gui::test {

class EntityContextMenuTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = tree.create_element(INVALID_ELEMENT, "document").value();
        card = tree.create_element(root, "task-card").value();
        popup = tree.create_element(root, "popup").value();
        ASSERT_TRUE(tree.focus(card));
    }

    std::unique_ptr<EntityContextMenu> make_menu(EntityKind kind) {
        auto created = EntityContextMenu::create(MenuHost{&document, &scheduler, &tree}, popup, kind);
        EXPECT_TRUE(created.has_value());
        if (!created) {
            return nullptr;
        }
        return std::move(created.value());
    }

    // Shaped like a task card's menu: view/edit, then a destructive section
    std::vector<MenuItem> task_actions() {
        return {
            MenuItem::action("view", "View Task", [this] { activated.push_back("view"); }),
            MenuItem::action("edit", "Edit Task", [this] { activated.push_back("edit"); }),
            MenuItem::divider("divider-1"),
            MenuItem::action("delete", "Delete Task", [this] { activated.push_back("delete"); })
                .as_destructive(),
        };
    }

    host::ElementTree tree;
    host::Document document;
    host::ManualTaskScheduler scheduler;

    ElementId root = INVALID_ELEMENT;
    ElementId card = INVALID_ELEMENT;
    ElementId popup = INVALID_ELEMENT;

    std::vector<std::string> activated;
};

TEST_F(EntityContextMenuTest, OpenAnnouncesEntityAndCount) {
    auto menu = make_menu(EntityKind::Task);
    ASSERT_NE(menu, nullptr);

    ASSERT_TRUE(menu->open(AnchorPosition::at(320.0, 200.0), task_actions()));

    EXPECT_TRUE(menu->controller().is_open());
    EXPECT_EQ(menu->controller().announcer().current(),
              "Task context menu opened. 3 actions available.");
    EXPECT_EQ(menu->controller().accessible_name(), "task actions");
}

TEST_F(EntityContextMenuTest, SingularActionCount) {
    auto menu = make_menu(EntityKind::Chat);
    ASSERT_NE(menu, nullptr);

    menu->open(AnchorPosition{}, {MenuItem::action("archive", "Archive", nullptr)});

    EXPECT_EQ(menu->controller().announcer().current(),
              "Chat context menu opened. 1 action available.");
    EXPECT_EQ(menu->controller().accessible_name(), "chat actions");
}

TEST_F(EntityContextMenuTest, EmptyItemsDoNotOpen) {
    auto menu = make_menu(EntityKind::Project);
    ASSERT_NE(menu, nullptr);

    EXPECT_FALSE(menu->open(AnchorPosition{}, {}));

    EXPECT_FALSE(menu->controller().is_open());
    EXPECT_TRUE(menu->controller().announcer().current().empty());
    EXPECT_EQ(tree.active_element(), card);
}

TEST_F(EntityContextMenuTest, ExplicitLabelOverridesDefault) {
    auto menu = make_menu(EntityKind::Task);
    ASSERT_NE(menu, nullptr);

    menu->open(AnchorPosition{}, task_actions(), std::string("Actions for Write docs"));

    EXPECT_EQ(menu->controller().accessible_name(), "Actions for Write docs");
}

TEST_F(EntityContextMenuTest, KeyboardActivationReturnsFocusToCard) {
    auto menu = make_menu(EntityKind::Task);
    ASSERT_NE(menu, nullptr);
    menu->open(AnchorPosition{}, task_actions());

    host::KeyEvent up;
    up.key = host::Key::ArrowUp;
    up.target = popup;
    document.dispatch_key_down(up);
    EXPECT_EQ(menu->controller().announcer().current(), "Delete Task (destructive action)");

    host::KeyEvent enter;
    enter.key = host::Key::Enter;
    enter.target = popup;
    document.dispatch_key_down(enter);

    EXPECT_EQ(activated, (std::vector<std::string>{"delete"}));
    EXPECT_FALSE(menu->controller().is_open());
    EXPECT_EQ(tree.active_element(), card);
}

TEST_F(EntityContextMenuTest, CloseForwardsToController) {
    auto menu = make_menu(EntityKind::Task);
    ASSERT_NE(menu, nullptr);
    menu->open(AnchorPosition{}, task_actions());

    menu->close();

    EXPECT_FALSE(menu->controller().is_open());
    EXPECT_EQ(menu->kind(), EntityKind::Task);
}

TEST(EntityNameTest, NamesAndLabels) {
    EXPECT_STREQ(entity_name(EntityKind::Task), "task");
    EXPECT_STREQ(entity_name(EntityKind::Project), "project");
    EXPECT_STREQ(entity_label(EntityKind::Chat), "Chat");
}

}  // namespace openflow::menukit::gui::test
