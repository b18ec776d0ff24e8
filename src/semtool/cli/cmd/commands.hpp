#pragma once

namespace semtool::cli {

struct options;

namespace cmd {

using command = int(const options&);

/// 'semtool parse': print the parts of each given version. Returns 1 if any are invalid.
command parse;
/// 'semtool compare': print the relation between two versions
command compare;

}  // namespace cmd

}  // namespace semtool::cli
