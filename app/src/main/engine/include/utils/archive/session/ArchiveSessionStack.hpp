// include/session/ArchiveSessionStack.hpp
#ifndef FILEUTIL_ARCHIVESESSIONSTACK_HPP
#define FILEUTIL_ARCHIVESESSIONSTACK_HPP

#include "ArchiveSession.hpp"
#include "utils/directory_engine.hpp"
#include "utils/metrics_base.hpp"
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace fileutil {
namespace session {

/**
 * Stack of nested archive sessions. Only the top session receives writes.
 *
 * Not thread safe: callers sequence begin/write/finalize on one stack.
 */
class ArchiveSessionStack : public MetricsBase {
private:
    std::vector<std::shared_ptr<ArchiveSession>> sessions_;
    uint64_t tempCounter_;
    DirectoryEngine directories_;

public:
    ArchiveSessionStack();
    ~ArchiveSessionStack() override;

    ArchiveSessionStack(const ArchiveSessionStack&) = delete;
    ArchiveSessionStack& operator=(const ArchiveSessionStack&) = delete;

    // Opens "<name>.<format>" under baseDirectory. With a session already open
    // and foldIntoParent set, output goes to "<dir>/.temp-<n>" until the
    // parent splices it in. Throws UnsupportedFormatException before touching disk.
    std::shared_ptr<ArchiveSession> begin(const std::string& name,
                                          const std::string& format,
                                          const std::string& baseDirectory,
                                          bool foldIntoParent = true);

    // Pops and finalizes the top session. An empty stack yields a ready
    // signal. Stream and usage failures are delivered through the returned
    // signal; ArchiveException propagates from the call itself.
    std::shared_future<void> finalize();

    std::shared_ptr<ArchiveSession> top() const;
    size_t depth() const { return sessions_.size(); }
    bool empty() const { return sessions_.empty(); }
    uint64_t getTempCounter() const { return tempCounter_; }
};

} // namespace session
} // namespace fileutil

#endif
