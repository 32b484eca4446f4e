#pragma once

#include <memory>
#include <string>
#include <vector>

#include "common.hpp"

extern "C" {
#include <archive.h>
}

class TInputStream : public TNonCopyable {
public:
    virtual ~TInputStream() {}

    /* Reads up to len bytes, got == 0 means end of stream */
    virtual TError Read(char *buf, size_t len, size_t &got) = 0;

    /* Reads until len bytes or end of stream */
    TError ReadFull(char *buf, size_t len, size_t &got);
};

class TFdInputStream : public TInputStream {
    int Fd;
public:
    TFdInputStream(int fd) : Fd(fd) {}
    TError Read(char *buf, size_t len, size_t &got) override;
};

class TStringInputStream : public TInputStream {
    std::string Data;
    size_t Offset = 0;
public:
    TStringInputStream(const std::string &data) : Data(data) {}
    TError Read(char *buf, size_t len, size_t &got) override;
};

/*
 * libarchive read handle fed from another stream.
 * Read() returns data of current archive entry.
 */
class TArchiveInputStream : public TInputStream {
    TInputStream &Source;
    std::vector<char> Buffer;
    TError SourceError;

    static ssize_t ReadSource(struct archive *archive, void *data, const void **buf);

protected:
    struct archive *Archive;

    /* Registers filters and formats before Open */
    virtual TError Setup() = 0;

    TError Open();
    std::string ErrorString() const;
    TError Check(int ret, const std::string &action) const;

public:
    TArchiveInputStream(TInputStream &source);
    virtual ~TArchiveInputStream();

    TError Read(char *buf, size_t len, size_t &got) override;
};

/* Compressed or plain byte stream, filter is detected by libarchive */
class TDecodedStream : public TArchiveInputStream {
    bool Empty = false;

protected:
    TError Setup() override;

public:
    TDecodedStream(TInputStream &source) : TArchiveInputStream(source) {}

    TError Init();
    TError Read(char *buf, size_t len, size_t &got) override;

    /* "none", "gzip", "xz", "bzip2", "zstd", ... */
    std::string Compression() const;
};

/*
 * Decoder for compression detected by magic, plain input is passed through.
 * Result reads source, which must outlive it.
 */
TError DecompressStream(TInputStream &source, std::unique_ptr<TDecodedStream> &result);
