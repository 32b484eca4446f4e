#include <algorithm>
#include <cstring>

#include "tarball.hpp"

extern "C" {
#include <unistd.h>
#include <archive.h>
#include <archive_entry.h>
}

using std::string;

namespace test {

static const time_t TEST_MTIME = 1500000000;

TTarEntry MakeEntry(const std::string &name, ETarType type, unsigned mode) {
    TTarEntry entry;
    entry.Name = name;
    entry.Type = type;
    entry.Mode = mode;
    entry.Uid = getuid();
    entry.Gid = getgid();
    entry.ModTime.tv_sec = TEST_MTIME;
    return entry;
}

static char TypeFlag(ETarType type) {
    switch (type) {
    case ETarType::Regular:
        return '0';
    case ETarType::Hardlink:
        return '1';
    case ETarType::Symlink:
        return '2';
    case ETarType::CharDevice:
        return '3';
    case ETarType::BlockDevice:
        return '4';
    case ETarType::Directory:
        return '5';
    case ETarType::Fifo:
        return '6';
    }
    return '0';
}

static void PutOctal(char *field, size_t len, uint64_t value) {
    string text = fmt::format("{:0{}o}", value, len - 1);
    if (text.size() > len - 1)
        throw string("Value " + std::to_string(value) + " does not fit into tar header");
    memcpy(field, text.c_str(), len);
}

static void PutString(char *field, size_t len, const std::string &value) {
    memset(field, 0, len);
    memcpy(field, value.c_str(), std::min(len, value.size()));
}

void TTarball::AddPadding() {
    size_t tail = Data.size() % TAR_BLOCK_SIZE;
    if (tail)
        Data.append(TAR_BLOCK_SIZE - tail, '\0');
}

void TTarball::AddHeader(const std::string &name, char typeflag,
                         const TTarEntry &entry, uint64_t size) {
    char block[TAR_BLOCK_SIZE];

    memset(block, 0, sizeof(block));
    PutString(block, 100, name);
    PutOctal(block + 100, 8, entry.Mode & 07777);
    PutOctal(block + 108, 8, entry.Uid);
    PutOctal(block + 116, 8, entry.Gid);
    PutOctal(block + 124, 12, size);
    PutOctal(block + 136, 12, entry.ModTime.tv_sec);
    memset(block + 148, ' ', 8);
    block[156] = typeflag;
    PutString(block + 157, 100, entry.LinkName);
    memcpy(block + 257, "ustar", 6);
    memcpy(block + 263, "00", 2);
    PutString(block + 265, 32, entry.UserName);
    PutString(block + 297, 32, entry.GroupName);
    PutOctal(block + 329, 8, entry.DevMajor);
    PutOctal(block + 337, 8, entry.DevMinor);

    unsigned sum = 0;
    for (size_t i = 0; i < TAR_BLOCK_SIZE; i++)
        sum += (unsigned char)block[i];
    string chksum = fmt::format("{:06o}", sum);
    memcpy(block + 148, chksum.c_str(), 7);

    Data.append(block, TAR_BLOCK_SIZE);
}

void TTarball::AddLongName(char typeflag, const std::string &name) {
    TTarEntry entry = MakeEntry("././@LongLink", ETarType::Regular, 0644);
    string data = name + '\0';
    AddHeader(entry.Name, typeflag, entry, data.size());
    Data += data;
    AddPadding();
}

void TTarball::AddPax(const TStringMap &records) {
    string data;

    for (auto &it: records) {
        string body = " " + it.first + "=" + it.second + "\n";
        size_t len = body.size() + 1;
        while (std::to_string(len).size() + body.size() != len)
            len = std::to_string(len).size() + body.size();
        data += std::to_string(len) + body;
    }

    TTarEntry entry = MakeEntry("././@PaxHeader", ETarType::Regular, 0644);
    AddHeader(entry.Name, 'x', entry, data.size());
    Data += data;
    AddPadding();
}

TTarball &TTarball::Add(const TTarEntry &entry, const std::string &content) {
    TStringMap pax;

    if (!entry.FileFlags.empty())
        pax["SCHILY.fflags"] = entry.FileFlags;

    for (auto &it: entry.Xattrs)
        pax["SCHILY.xattr." + it.first] = it.second;

    if (entry.HasAccessTime)
        pax["atime"] = fmt::format("{}.{:09}", entry.AccessTime.tv_sec,
                                   entry.AccessTime.tv_nsec);

    if (entry.ModTime.tv_nsec)
        pax["mtime"] = fmt::format("{}.{:09}", entry.ModTime.tv_sec,
                                   entry.ModTime.tv_nsec);

    if (!pax.empty())
        AddPax(pax);

    if (entry.LinkName.size() >= 100)
        AddLongName('K', entry.LinkName);

    string name = entry.Name;
    if (name.size() >= 100) {
        AddLongName('L', name);
        name = name.substr(0, 99);
    }

    TTarEntry header = entry;
    if (header.LinkName.size() >= 100)
        header.LinkName = header.LinkName.substr(0, 99);

    AddHeader(name, TypeFlag(entry.Type), header, content.size());
    Data += content;
    AddPadding();

    return *this;
}

TTarball &TTarball::File(const std::string &name, const std::string &content,
                         unsigned mode) {
    return Add(MakeEntry(name, ETarType::Regular, mode), content);
}

TTarball &TTarball::Directory(const std::string &name, unsigned mode) {
    return Add(MakeEntry(name, ETarType::Directory, mode));
}

TTarball &TTarball::Symlink(const std::string &name, const std::string &target) {
    TTarEntry entry = MakeEntry(name, ETarType::Symlink, 0777);
    entry.LinkName = target;
    return Add(entry);
}

TTarball &TTarball::Hardlink(const std::string &name, const std::string &target) {
    TTarEntry entry = MakeEntry(name, ETarType::Hardlink, 0644);
    entry.LinkName = target;
    return Add(entry);
}

TTarball &TTarball::Fifo(const std::string &name) {
    return Add(MakeEntry(name, ETarType::Fifo, 0644));
}

TTarball &TTarball::Append(const std::string &data) {
    Data += data;
    return *this;
}

std::string TTarball::Finish() const {
    return Data + string(TAR_BLOCK_SIZE * 2, '\0');
}

static ssize_t AppendOutput(struct archive *, void *data, const void *buf, size_t len) {
    static_cast<string *>(data)->append((const char *)buf, len);
    return len;
}

static void CheckArchive(struct archive *archive, int ret, const char *action) {
    if (ret < ARCHIVE_WARN) {
        const char *error = archive_error_string(archive);
        string text = error ? error : "unspecified error";
        archive_write_free(archive);
        throw string(action) + ": " + text;
    }
}

/* single raw entry behind compression filter */
std::string Compress(const std::string &data, int filter) {
    struct archive *archive = archive_write_new();
    string result;

    CheckArchive(archive, archive_write_add_filter(archive, filter), "archive_write_add_filter");
    CheckArchive(archive, archive_write_set_format_raw(archive), "archive_write_set_format_raw");
    CheckArchive(archive, archive_write_set_bytes_in_last_block(archive, 1),
                 "archive_write_set_bytes_in_last_block");
    CheckArchive(archive, archive_write_open(archive, &result, nullptr, AppendOutput, nullptr),
                 "archive_write_open");

    struct archive_entry *entry = archive_entry_new();
    archive_entry_set_pathname(entry, "layer.tar");
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, 0644);
    archive_entry_set_size(entry, data.size());

    int ret = archive_write_header(archive, entry);
    archive_entry_free(entry);
    CheckArchive(archive, ret, "archive_write_header");

    if (archive_write_data(archive, data.data(), data.size()) != (ssize_t)data.size())
        CheckArchive(archive, ARCHIVE_FATAL, "archive_write_data");

    CheckArchive(archive, archive_write_close(archive), "archive_write_close");
    archive_write_free(archive);

    return result;
}

std::string GzipCompress(const std::string &data) {
    return Compress(data, ARCHIVE_FILTER_GZIP);
}

std::string XzCompress(const std::string &data) {
    return Compress(data, ARCHIVE_FILTER_XZ);
}

std::string Bzip2Compress(const std::string &data) {
    return Compress(data, ARCHIVE_FILTER_BZIP2);
}

std::string ZstdCompress(const std::string &data) {
    return Compress(data, ARCHIVE_FILTER_ZSTD);
}

}
