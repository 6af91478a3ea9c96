#pragma once
#include <string>
#include <vector>

namespace frl {

struct ProcessResult {
  int exitCode = -1;       // -1 when the child did not exit normally
  std::string stdoutText;
};

// fork/execvp without a shell; argv[0] is resolved through PATH.
// stderr is inherited. Throws std::runtime_error if the child cannot be started.
ProcessResult runProcess(const std::vector<std::string>& argv);

} // namespace frl
