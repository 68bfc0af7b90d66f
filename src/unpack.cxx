#include <log.hxx>
#include <unpack.hxx>

#include <memory>
#include <string>

#include <archive.h>
#include <archive_entry.h>

using archive_reader_t = std::unique_ptr<archive, decltype(&archive_read_free)>;
using archive_writer_t = std::unique_ptr<archive, decltype(&archive_write_free)>;

static const char *error_string(archive *arc)
{
    const auto message = archive_error_string(arc);
    return message ? message : "unknown error";
}

static bool is_entry_named(archive_entry *entry, const std::string_view name)
{
    if (archive_entry_filetype(entry) != AE_IFREG)
    {
        return false;
    }

    const auto pathname = archive_entry_pathname(entry);
    if (!pathname)
    {
        return false;
    }

    return std::filesystem::path(pathname).filename() == std::filesystem::path(name);
}

static int extract_entry(archive *arc, archive_entry *entry, const std::filesystem::path &destination)
{
    archive_writer_t ext(archive_write_disk_new(), archive_write_free);

    archive_write_disk_set_options(
        ext.get(),
        ARCHIVE_EXTRACT_TIME
        | ARCHIVE_EXTRACT_PERM
        | ARCHIVE_EXTRACT_SECURE_NODOTDOT);

    const auto destination_string = destination.string();
    archive_entry_set_pathname(entry, destination_string.c_str());

    if (archive_write_header(ext.get(), entry) != ARCHIVE_OK)
    {
        Error("failed to write ", destination_string, ": ", error_string(ext.get()));
        return 1;
    }

    const void *buf;
    std::size_t len;
    la_int64_t off;

    while (true)
    {
        if (const auto error = archive_read_data_block(arc, &buf, &len, &off))
        {
            if (error == ARCHIVE_EOF)
            {
                break;
            }

            Error("failed to read archive data block: ", error_string(arc));
            return 1;
        }

        if (archive_write_data_block(ext.get(), buf, len, off) != ARCHIVE_OK)
        {
            Error("failed to write archive data block: ", error_string(ext.get()));
            return 1;
        }
    }

    if (archive_write_finish_entry(ext.get()) != ARCHIVE_OK)
    {
        Error("failed to finish ", destination_string, ": ", error_string(ext.get()));
        return 1;
    }

    return 0;
}

int UnpackArtifact(const std::filesystem::path &artifact,
                   const std::string_view name,
                   const std::filesystem::path &directory,
                   std::filesystem::path &result)
{
    archive_reader_t arc(archive_read_new(), archive_read_free);

    archive_read_support_format_all(arc.get());
    archive_read_support_format_raw(arc.get());
    archive_read_support_filter_all(arc.get());

    const auto artifact_string = artifact.string();

    if (archive_read_open_filename(arc.get(), artifact_string.c_str(), 0x4000) != ARCHIVE_OK)
    {
        Error("failed to open ", artifact_string, ": ", error_string(arc.get()));
        return 1;
    }

    archive_entry *entry;

    auto err = archive_read_next_header(arc.get(), &entry);
    if (err == ARCHIVE_EOF)
    {
        Error("downloaded file ", artifact_string, " is empty");
        return 1;
    }

    if (err < ARCHIVE_WARN)
    {
        Error("failed to read ", artifact_string, ": ", error_string(arc.get()));
        return 1;
    }

    // an uncompressed file nobody else claimed is the binary itself
    const auto raw = (archive_format(arc.get()) & ARCHIVE_FORMAT_BASE_MASK) == ARCHIVE_FORMAT_RAW;
    if (raw && archive_filter_code(arc.get(), 0) == ARCHIVE_FILTER_NONE)
    {
        result = artifact;
        return 0;
    }

    Debug("unpacking ", artifact_string, " (", archive_format_name(arc.get()), ", ", archive_filter_name(arc.get(), 0), ")");

    std::error_code error;
    std::filesystem::create_directories(directory, error);
    if (error)
    {
        Error("failed to create ", directory.string(), ": ", error.message());
        return 1;
    }

    const auto destination = directory / std::string(name);

    while (true)
    {
        if (raw || is_entry_named(entry, name))
        {
            if (const auto extract_error = extract_entry(arc.get(), entry, destination))
            {
                return extract_error;
            }

            result = destination;
            return 0;
        }

        err = archive_read_next_header(arc.get(), &entry);
        if (err == ARCHIVE_EOF)
        {
            break;
        }

        if (err < ARCHIVE_WARN)
        {
            Error("failed to read archive header: ", error_string(arc.get()));
            return 1;
        }
    }

    Error("archive ", artifact_string, " does not contain ", name);
    return 1;
}
