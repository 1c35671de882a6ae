#include "link_publisher.hpp"
#include "errors.hpp"
#include <filesystem>
#include <iostream>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

bool publish_link(const std::string& stable_path, const std::string& target,
                  std::string* error) {
    auto fail = [error](const std::string& reason) {
        if (error) {
            *error = reason;
        }
        return false;
    };

    if (stable_path.empty()) {
        return fail("stable path is empty");
    }
    if (target.empty()) {
        return fail("no device node to link to");
    }

    const fs::path link(stable_path);
    std::error_code ec;

    fs::file_status status = fs::symlink_status(link, ec);
    if (fs::is_symlink(status)) {
        fs::path current = fs::read_symlink(link, ec);
        if (!ec && current == fs::path(target)) {
            return true;
        }
    } else if (fs::is_directory(status)) {
        return fail(stable_path + " is a directory");
    }

    if (link.has_parent_path()) {
        fs::create_directories(link.parent_path(), ec);
        if (ec) {
            return fail("cannot create " + link.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path staging = link;
    staging += ".tmp." + std::to_string(getpid());
    fs::remove(staging, ec);

    fs::create_symlink(target, staging, ec);
    if (ec) {
        return fail("cannot create " + staging.string() + ": " + ec.message());
    }

    fs::rename(staging, link, ec);
    if (ec) {
        std::string reason = "cannot replace " + stable_path + ": " + ec.message();
        fs::remove(staging, ec);
        return fail(reason);
    }

    return true;
}

static bool publish_one(const std::string& stable_path, const std::string& target) {
    std::string error;
    if (!publish_link(stable_path, target, &error)) {
        std::cerr << error_kind_name(ErrorKind::SymlinkPublish) << ": "
                  << stable_path << ": " << error << "\n";
        return false;
    }
    std::cout << "Linked " << stable_path << " -> " << target << "\n";
    return true;
}

LinkReport publish_links(const StableLinkSet& links) {
    LinkReport report;
    report.event_published = publish_one(links.event_link, links.event_target);
    report.joystick_published = publish_one(links.joystick_link, links.joystick_target);
    return report;
}

bool remove_link(const std::string& stable_path) {
    std::error_code ec;
    if (!fs::is_symlink(fs::symlink_status(stable_path, ec))) {
        return false;
    }
    return fs::remove(stable_path, ec) && !ec;
}
