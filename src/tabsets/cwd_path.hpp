#pragma once

#include <string>

enum class PathStyle { Posix, Windows };

// Converts a pane working directory as reported by the host into a path that
// can be handed back to spawn/split.
//
//   file:///home/u/src        -> /home/u/src
//   file://myhost/home/u/src  -> /home/u/src
//   file:///C:/Users/u        -> C:/Users/u      (PathStyle::Windows)
//   /home/u/My%20Dir          -> unchanged (only URIs are decoded)
//
// Percent escapes inside a URI are decoded. Anything that is not a file URI
// is returned as is.
std::string path_from_cwd(const std::string& cwd, PathStyle style = PathStyle::Posix);
