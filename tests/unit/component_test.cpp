#include <tether/ui/component.h>
#include <tether/ui/markup.h>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace tether::ui;
using tether::core::ErrorCode;
namespace url = tether::url;

namespace {

class Label : public Component {
public:
    std::string render() const override { return "<p>" + text + "</p>"; }
    void on_mount() override { ++mounts; }
    void on_dismount() override { ++dismounts; }

    std::string text = "hello";
    int mounts = 0;
    int dismounts = 0;
};

class Home : public Component {
public:
    std::string render() const override { return "<div>home</div>"; }
};

std::string name_of(const char* raw) {
    auto u = url::parse(raw);
    return u ? component_name_from_url(*u) : std::string("<unparsable>");
}

} // namespace

// =============================================================================
// ComponentFactory
// =============================================================================
TEST(ComponentFactoryTest, RegisterAndMake) {
    ComponentFactory factory;
    ASSERT_TRUE(factory.register_component<Home>("home").ok);
    EXPECT_TRUE(factory.is_registered("home"));

    auto made = factory.make("home");
    ASSERT_TRUE(made.status.ok);
    ASSERT_NE(made.component, nullptr);
    EXPECT_EQ(made.component->render(), "<div>home</div>");
}

TEST(ComponentFactoryTest, EachMakeIsANewInstance) {
    ComponentFactory factory;
    factory.register_component<Home>("home");
    auto a = factory.make("home");
    auto b = factory.make("home");
    EXPECT_NE(a.component, b.component);
}

TEST(ComponentFactoryTest, NamesAreCaseInsensitive) {
    ComponentFactory factory;
    factory.register_component<Home>("Home");
    EXPECT_TRUE(factory.is_registered("HOME"));
    EXPECT_TRUE(factory.make("hOmE").status.ok);
    EXPECT_EQ(factory.names(), (std::vector<std::string>{"home"}));
}

TEST(ComponentFactoryTest, DuplicateRegistrationFails) {
    ComponentFactory factory;
    ASSERT_TRUE(factory.register_component<Home>("home").ok);
    auto status = factory.register_component<Label>("HOME");
    EXPECT_EQ(status.code, ErrorCode::AlreadyRegistered);
    EXPECT_EQ(factory.make("home").component->render(), "<div>home</div>");
}

TEST(ComponentFactoryTest, InvalidRegistrationFails) {
    ComponentFactory factory;
    EXPECT_EQ(factory.register_component<Home>("").code, ErrorCode::InvalidArgument);
    EXPECT_EQ(factory.register_component("home", ComponentFactory::Constructor{}).code,
              ErrorCode::InvalidArgument);
}

TEST(ComponentFactoryTest, UnknownNameIsNotFound) {
    ComponentFactory factory;
    auto made = factory.make("settings");
    EXPECT_EQ(made.status.code, ErrorCode::NotFound);
    EXPECT_EQ(made.component, nullptr);
    EXPECT_EQ(factory.make("").status.code, ErrorCode::NotFound);
}

TEST(ComponentFactoryTest, NullConstructorResultIsInvalidArgument) {
    ComponentFactory factory;
    factory.register_component("ghost", []() { return std::shared_ptr<Component>(); });
    EXPECT_EQ(factory.make("ghost").status.code, ErrorCode::InvalidArgument);
}

TEST(ComponentFactoryTest, NamesAreSorted) {
    ComponentFactory factory;
    factory.register_component<Home>("settings");
    factory.register_component<Home>("home");
    factory.register_component<Home>("about");
    EXPECT_EQ(factory.names(), (std::vector<std::string>{"about", "home", "settings"}));
}

// =============================================================================
// component_name_from_url
// =============================================================================
TEST(ComponentNameTest, HostNamesComponent) {
    EXPECT_EQ(name_of("app://home"), "home");
    EXPECT_EQ(name_of("app://Settings/advanced?tab=1"), "settings");
}

TEST(ComponentNameTest, FirstPathSegmentWithoutHost) {
    EXPECT_EQ(name_of("/settings/advanced"), "settings");
    EXPECT_EQ(name_of("mac.menubar?appurl=x"), "mac.menubar");
    EXPECT_EQ(name_of("About"), "about");
}

TEST(ComponentNameTest, EmptyWhenUrlNamesNothing) {
    EXPECT_EQ(name_of("/"), "");
    EXPECT_EQ(name_of("?x=1"), "");
}

// =============================================================================
// BasicMarkup
// =============================================================================
TEST(BasicMarkupTest, MountRecordsRenderAndCallsHook) {
    BasicMarkup markup;
    auto label = std::make_shared<Label>();

    ASSERT_TRUE(markup.mount(label).ok);
    EXPECT_TRUE(markup.contains(*label));
    EXPECT_EQ(markup.rendered(*label), "<p>hello</p>");
    EXPECT_EQ(label->mounts, 1);
    EXPECT_EQ(markup.mounted_count(), 1u);
}

TEST(BasicMarkupTest, DoubleMountFails) {
    BasicMarkup markup;
    auto label = std::make_shared<Label>();
    markup.mount(label);
    EXPECT_EQ(markup.mount(label).code, ErrorCode::InvalidArgument);
    EXPECT_EQ(label->mounts, 1);
}

TEST(BasicMarkupTest, NullComponentIsInvalidArgument) {
    BasicMarkup markup;
    EXPECT_EQ(markup.mount(nullptr).code, ErrorCode::InvalidArgument);
    EXPECT_EQ(markup.dismount(nullptr).code, ErrorCode::InvalidArgument);
    EXPECT_EQ(markup.update(nullptr).code, ErrorCode::InvalidArgument);
}

TEST(BasicMarkupTest, DismountRemovesAndCallsHook) {
    BasicMarkup markup;
    auto label = std::make_shared<Label>();
    markup.mount(label);

    ASSERT_TRUE(markup.dismount(label).ok);
    EXPECT_FALSE(markup.contains(*label));
    EXPECT_FALSE(markup.rendered(*label).has_value());
    EXPECT_EQ(label->dismounts, 1);
    EXPECT_EQ(markup.dismount(label).code, ErrorCode::NotFound);
}

TEST(BasicMarkupTest, UpdateReRenders) {
    BasicMarkup markup;
    auto label = std::make_shared<Label>();
    markup.mount(label);

    label->text = "changed";
    ASSERT_TRUE(markup.update(label).ok);
    EXPECT_EQ(markup.rendered(*label), "<p>changed</p>");
}

TEST(BasicMarkupTest, UpdateOfUnmountedIsNotFound) {
    BasicMarkup markup;
    auto label = std::make_shared<Label>();
    EXPECT_EQ(markup.update(label).code, ErrorCode::NotFound);
}
