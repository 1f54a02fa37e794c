#pragma once

#include <string>
#include <string_view>

// Where a project directory says its sessions ran.
struct ProjectLocation {
    std::string name; // display name, last path segment
    std::string path; // reconstructed filesystem path
};

// Decode a project directory name such as "-home-alice-proj" into
// {"proj", "/home/alice/proj"}. Names without the leading delimiter are used
// verbatim for both fields.
//
// The encoding is lossy: a '-' inside a real path segment is indistinguishable
// from a separator, so "-home-alice-my-app" decodes to "/home/alice/my/app".
ProjectLocation decode_project_dir(std::string_view dir_name);
