#include "workspace.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace quizjudge {
using namespace std;
namespace fs = std::filesystem;

workspace_manager::workspace_manager(const fs::path &scratch_root, bool keep_workspaces)
    : scratch_root(scratch_root), keep_workspaces(keep_workspaces) {}

workspace_manager::~workspace_manager() {}

workspace workspace_manager::allocate() const {
    workspace ws;
    ws.id = "exec_" + boost::lexical_cast<string>(boost::uuids::random_generator()());

    error_code ec;
    fs::create_directories(scratch_root, ec);
    if (!ec) ws.path = fs::absolute(scratch_root, ec) / ws.id;
    if (!ec) fs::create_directory(ws.path, ec);
    if (ec) {
        if (ec == errc::permission_denied || ec == errc::read_only_file_system)
            throw permission_error(fmt::format("No write permission for scratch directory {}: {}", scratch_root.string(), ec.message()));
        throw allocation_error(fmt::format("Unable to create workspace in {}: {}", scratch_root.string(), ec.message()));
    }

    DLOG(INFO) << "Allocated workspace " << ws.path;
    return ws;
}

void workspace_manager::verify_writable(const workspace &ws) const {
    if (!is_writable_directory(ws.path))
        throw permission_error(fmt::format("No write permission for {}", ws.path.string()));
}

void workspace_manager::materialize(const workspace &ws, const map<string, string> &files) const {
    for (auto &[name, content] : files) {
        fs::path filename = ws.path / assert_safe_path(name);
        try {
            if (filename.parent_path() != ws.path)
                fs::create_directories(filename.parent_path());
            write_file_content(filename, content);
        } catch (system_error &ex) {
            throw permission_error(fmt::format("Unable to write {} into {}: {}", name, ws.path.string(), ex.what()));
        }
    }
}

void workspace_manager::dispose(const workspace &ws) const noexcept {
    if (ws.path.empty()) return;
    if (keep_workspaces) {
        LOG(INFO) << "Keeping workspace " << ws.path;
        return;
    }
    error_code ec;
    fs::remove_all(ws.path, ec);
    if (ec)
        LOG(ERROR) << "Unable to delete workspace " << ws.path << " " << ec.message();
    else
        DLOG(INFO) << "Disposed workspace " << ws.path;
}

const fs::path &workspace_manager::root() const {
    return scratch_root;
}

scoped_workspace::scoped_workspace(const workspace_manager &manager)
    : manager(manager), ws(manager.allocate()) {}

scoped_workspace::~scoped_workspace() {
    dispose();
}

const workspace &scoped_workspace::get() const {
    return ws;
}

void scoped_workspace::dispose() {
    if (disposed) return;
    disposed = true;
    manager.dispose(ws);
}

}  // namespace quizjudge
