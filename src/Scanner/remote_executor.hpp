#ifndef remote_executor_hpp
#define remote_executor_hpp

#include <chrono>
#include <string>

namespace scan {

struct CommandResult {
    int exit_status = 0;
    std::string out;
    std::string err;
};

/**
 * Runs a shell command on a remote host (SSH or equivalent).
 * A non-zero exit status, a timeout or a thrown exception all count as a
 * failed inspection step.
 */
class RemoteExecutor {
public:
    virtual ~RemoteExecutor() = default;

    virtual CommandResult execute(const std::string& address,
                                  const std::string& command,
                                  std::chrono::milliseconds timeout) = 0;
};

} // namespace scan

#endif // remote_executor_hpp
