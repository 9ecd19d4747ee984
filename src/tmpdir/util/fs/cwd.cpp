#include "./cwd.hpp"

#include <tmpdir/util/log.hpp>

using namespace tmpdir;

cwd_scope::cwd_scope(path_ref dir)
    : _previous(fs::current_path()) {
    fs::current_path(dir);
    tmpdir_log(trace, "Entered working directory [{}]", dir.string());
}

cwd_scope::~cwd_scope() {
    std::error_code ec;
    fs::current_path(_previous, ec);
    if (ec) {
        tmpdir_log(error,
                   "Failed to restore the working directory to [{}]: {}",
                   _previous.string(),
                   ec.message());
    }
}
