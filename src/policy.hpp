#pragma once

#include <string>

#include "common.hpp"
#include "util/path.hpp"

class TPathPolicy {
public:
    virtual ~TPathPolicy() {}
    virtual std::string Name() const = 0;
    virtual char Separator() const = 0;
    /* Entries which cannot be represented on target filesystem */
    virtual bool SkipName(const std::string &name) const = 0;
};

class THostPathPolicy : public TPathPolicy {
public:
    std::string Name() const override { return "host"; }
    char Separator() const override { return '/'; }
    bool SkipName(const std::string &) const override { return false; }
};

class TWindowsPathPolicy : public TPathPolicy {
public:
    std::string Name() const override { return "windows"; }
    char Separator() const override { return '\\'; }
    bool SkipName(const std::string &name) const override {
        return name.find(':') != std::string::npos;
    }
};

const TPathPolicy &HostPathPolicy();
const TPathPolicy &WindowsPathPolicy();
TError FindPathPolicy(const std::string &name, const TPathPolicy *&policy);

/*
 * Joins normalized name under root and checks that result stays inside:
 *
 * ("/root", "a/../b") -> "/root/b"
 * ("/root", "../etc") -> Breakout
 */
TError ValidateEntryPath(const TPath &root, const std::string &name,
                         const TPathPolicy &policy, TPath &path);

/* True if relative path starts with parent directory */
bool IsBreakout(const TPath &rel, const TPathPolicy &policy);
