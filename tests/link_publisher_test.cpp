#include "link_publisher.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <sys/stat.h>

namespace fs = std::filesystem;

class LinkPublisherTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/padmirror-links-XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        root = tmpl;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    std::string path(const std::string& name) const { return (root / name).string(); }

    static ino_t inode_of(const std::string& p) {
        struct stat st;
        if (lstat(p.c_str(), &st) != 0) {
            return 0;
        }
        return st.st_ino;
    }

    fs::path root;
};

TEST_F(LinkPublisherTest, CreatesLink) {
    std::string error;
    ASSERT_TRUE(publish_link(path("gamepad-event"), "/dev/input/event17", &error)) << error;

    EXPECT_TRUE(fs::is_symlink(path("gamepad-event")));
    EXPECT_EQ(fs::read_symlink(path("gamepad-event")), fs::path("/dev/input/event17"));
}

TEST_F(LinkPublisherTest, SecondPublishIsNoOp) {
    ASSERT_TRUE(publish_link(path("gamepad-event"), "/dev/input/event17"));
    ino_t first = inode_of(path("gamepad-event"));
    ASSERT_NE(first, 0u);

    std::string error;
    ASSERT_TRUE(publish_link(path("gamepad-event"), "/dev/input/event17", &error)) << error;
    EXPECT_EQ(inode_of(path("gamepad-event")), first);
    EXPECT_EQ(fs::read_symlink(path("gamepad-event")), fs::path("/dev/input/event17"));

    // No staging leftovers
    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(root)) {
        (void)entry;
        entries++;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(LinkPublisherTest, ReplacesStaleLink) {
    fs::create_symlink("/dev/input/event3", path("gamepad-event"));

    ASSERT_TRUE(publish_link(path("gamepad-event"), "/dev/input/event17"));
    EXPECT_EQ(fs::read_symlink(path("gamepad-event")), fs::path("/dev/input/event17"));
}

TEST_F(LinkPublisherTest, ReplacesRegularFile) {
    std::ofstream(path("gamepad-js")) << "stale";

    ASSERT_TRUE(publish_link(path("gamepad-js"), "/dev/input/js0"));
    EXPECT_TRUE(fs::is_symlink(path("gamepad-js")));
    EXPECT_EQ(fs::read_symlink(path("gamepad-js")), fs::path("/dev/input/js0"));
}

TEST_F(LinkPublisherTest, CreatesParentDirectories) {
    std::string link = path("run/pad/gamepad-event");
    ASSERT_TRUE(publish_link(link, "/dev/input/event17"));
    EXPECT_TRUE(fs::is_symlink(link));
}

TEST_F(LinkPublisherTest, RefusesDirectory) {
    fs::create_directory(path("gamepad-event"));

    std::string error;
    EXPECT_FALSE(publish_link(path("gamepad-event"), "/dev/input/event17", &error));
    EXPECT_FALSE(error.empty());
    EXPECT_TRUE(fs::is_directory(path("gamepad-event")));
}

TEST_F(LinkPublisherTest, RefusesEmptyTarget) {
    EXPECT_FALSE(publish_link(path("gamepad-js"), ""));
    EXPECT_FALSE(fs::exists(fs::symlink_status(path("gamepad-js"))));
}

TEST_F(LinkPublisherTest, OneFailedLinkDoesNotBlockTheOther) {
    // A regular file where a parent directory is needed
    std::ofstream(path("blocker")) << "x";

    StableLinkSet links;
    links.event_link = path("gamepad-event");
    links.event_target = "/dev/input/event17";
    links.joystick_link = path("blocker/gamepad-js");
    links.joystick_target = "/dev/input/js0";

    LinkReport report = publish_links(links);
    EXPECT_TRUE(report.event_published);
    EXPECT_FALSE(report.joystick_published);
    EXPECT_FALSE(report.complete());
    EXPECT_EQ(fs::read_symlink(path("gamepad-event")), fs::path("/dev/input/event17"));
}

TEST_F(LinkPublisherTest, MissingJoystickNodeFailsOnlyThatLink) {
    StableLinkSet links;
    links.event_link = path("gamepad-event");
    links.event_target = "/dev/input/event17";
    links.joystick_link = path("gamepad-js");

    LinkReport report = publish_links(links);
    EXPECT_TRUE(report.event_published);
    EXPECT_FALSE(report.joystick_published);
}

TEST_F(LinkPublisherTest, PublishLinksIsIdempotent) {
    StableLinkSet links;
    links.event_link = path("gamepad-event");
    links.event_target = "/dev/input/event17";
    links.joystick_link = path("gamepad-js");
    links.joystick_target = "/dev/input/js0";

    ASSERT_TRUE(publish_links(links).complete());
    ino_t event_inode = inode_of(links.event_link);
    ino_t js_inode = inode_of(links.joystick_link);

    ASSERT_TRUE(publish_links(links).complete());
    EXPECT_EQ(inode_of(links.event_link), event_inode);
    EXPECT_EQ(inode_of(links.joystick_link), js_inode);
}

TEST_F(LinkPublisherTest, RemoveOnlyTouchesSymlinks) {
    ASSERT_TRUE(publish_link(path("gamepad-event"), "/dev/input/event17"));
    std::ofstream(path("data")) << "keep";

    EXPECT_TRUE(remove_link(path("gamepad-event")));
    EXPECT_FALSE(fs::exists(fs::symlink_status(path("gamepad-event"))));

    EXPECT_FALSE(remove_link(path("data")));
    EXPECT_TRUE(fs::exists(path("data")));

    EXPECT_FALSE(remove_link(path("missing")));
}
