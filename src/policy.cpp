#include "policy.hpp"

#include <algorithm>

const TPathPolicy &HostPathPolicy() {
    static THostPathPolicy policy;
    return policy;
}

const TPathPolicy &WindowsPathPolicy() {
    static TWindowsPathPolicy policy;
    return policy;
}

TError FindPathPolicy(const std::string &name, const TPathPolicy *&policy) {
    if (name == "" || name == "host")
        policy = &HostPathPolicy();
    else if (name == "windows")
        policy = &WindowsPathPolicy();
    else
        return TError(EError::InvalidValue, "Unknown name policy: {}", name);
    return OK;
}

bool IsBreakout(const TPath &rel, const TPathPolicy &policy) {
    std::string str = rel.ToString();
    char sep = policy.Separator();

    if (sep != '/')
        std::replace(str.begin(), str.end(), '/', sep);

    return str == ".." || StringStartsWith(str, std::string("..") + sep);
}

TError ValidateEntryPath(const TPath &root, const std::string &name,
                         const TPathPolicy &policy, TPath &path) {
    TPath clean = TPath(name).NormalPath();

    path = (root / clean).NormalPath();

    TPath rel = path.RelativePath(root);
    if (rel.IsEmpty() || IsBreakout(rel, policy))
        return TError(EError::Breakout, "{} is outside of {}", name, root);

    return OK;
}
