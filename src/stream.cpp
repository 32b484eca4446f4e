#include "stream.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <cstring>

extern "C" {
#include <unistd.h>
#include <errno.h>
}

constexpr size_t ARCHIVE_READ_BUFFER = 64 << 10;

TError TInputStream::ReadFull(char *buf, size_t len, size_t &got) {
    TError error;
    size_t ret;

    got = 0;
    while (got < len) {
        error = Read(buf + got, len - got, ret);
        if (error)
            return error;
        if (!ret)
            break;
        got += ret;
    }

    return OK;
}

TError TFdInputStream::Read(char *buf, size_t len, size_t &got) {
    ssize_t ret;

    do
        ret = read(Fd, buf, len);
    while (ret < 0 && errno == EINTR);

    if (ret < 0) {
        got = 0;
        return TError::System("read");
    }

    got = ret;
    return OK;
}

TError TStringInputStream::Read(char *buf, size_t len, size_t &got) {
    got = std::min(len, Data.size() - Offset);
    memcpy(buf, Data.data() + Offset, got);
    Offset += got;
    return OK;
}

TArchiveInputStream::TArchiveInputStream(TInputStream &source) :
    Source(source), Buffer(ARCHIVE_READ_BUFFER), Archive(archive_read_new()) {}

TArchiveInputStream::~TArchiveInputStream() {
    if (Archive)
        archive_read_free(Archive);
}

ssize_t TArchiveInputStream::ReadSource(struct archive *archive, void *data,
                                        const void **buf) {
    TArchiveInputStream *stream = static_cast<TArchiveInputStream *>(data);
    size_t got;

    stream->SourceError = stream->Source.Read(stream->Buffer.data(),
                                              stream->Buffer.size(), got);
    if (stream->SourceError) {
        archive_set_error(archive, stream->SourceError.Errno ? stream->SourceError.Errno : EIO,
                          "%s", stream->SourceError.ToString().c_str());
        return ARCHIVE_FATAL;
    }

    *buf = stream->Buffer.data();
    return got;
}

std::string TArchiveInputStream::ErrorString() const {
    const char *text = archive_error_string(Archive);
    return text ? text : "unspecified error";
}

/* errors of underlying stream are returned as is */
TError TArchiveInputStream::Check(int ret, const std::string &action) const {
    if (ret == ARCHIVE_OK)
        return OK;

    if (SourceError)
        return TError(SourceError, "{}", action);

    if (ret == ARCHIVE_WARN) {
        L_WRN("{}: {}", action, ErrorString());
        return OK;
    }

    return TError(EError::StreamError, "{}: {}", action, ErrorString());
}

TError TArchiveInputStream::Open() {
    TError error;

    if (!Archive)
        return TError(EError::Unknown, ENOMEM, "archive_read_new");

    error = Setup();
    if (error)
        return error;

    error = Check(archive_read_set_callback_data(Archive, this), "Cannot set archive source");
    if (error)
        return error;

    error = Check(archive_read_set_read_callback(Archive, ReadSource), "Cannot set archive source");
    if (error)
        return error;

    return Check(archive_read_open1(Archive), "Cannot open archive");
}

TError TArchiveInputStream::Read(char *buf, size_t len, size_t &got) {
    got = 0;
    if (!len)
        return OK;

    ssize_t ret = archive_read_data(Archive, buf, len);
    if (ret < 0) {
        if (SourceError)
            return TError(SourceError, "Cannot read archive data");
        return TError(EError::StreamError, "Cannot read archive data: {}", ErrorString());
    }

    got = ret;
    return OK;
}

TError TDecodedStream::Setup() {
    TError error;

    error = Check(archive_read_support_filter_all(Archive), "Cannot enable decompression");
    if (error)
        return error;

    /* empty stream is neither raw nor compressed */
    error = Check(archive_read_support_format_empty(Archive), "Cannot enable empty format");
    if (error)
        return error;

    return Check(archive_read_support_format_raw(Archive), "Cannot enable raw format");
}

TError TDecodedStream::Init() {
    struct archive_entry *entry;
    TError error;
    int ret;

    error = Open();
    if (error)
        return error;

    ret = archive_read_next_header(Archive, &entry);
    if (ret == ARCHIVE_EOF) {
        Empty = true;
        return OK;
    }

    return Check(ret, "Cannot decode stream");
}

TError TDecodedStream::Read(char *buf, size_t len, size_t &got) {
    if (Empty) {
        got = 0;
        return OK;
    }
    return TArchiveInputStream::Read(buf, len, got);
}

std::string TDecodedStream::Compression() const {
    const char *name = archive_filter_name(Archive, 0);
    return name ? name : "none";
}

TError DecompressStream(TInputStream &source, std::unique_ptr<TDecodedStream> &result) {
    std::unique_ptr<TDecodedStream> decoded(new TDecodedStream(source));
    TError error;

    error = decoded->Init();
    if (error)
        return TError(error, "Cannot detect compression");

    L_DBG("Layer compression: {}", decoded->Compression());

    result = std::move(decoded);
    return OK;
}
