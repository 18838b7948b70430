#include <unpack.hxx>
#include <util.hxx>

#include <fstream>
#include <iostream>

#include <archive.h>
#include <archive_entry.h>

bool IsArchive(const std::filesystem::path &path)
{
    const auto name = Lower(path.filename().string());

    for (auto suffix : { ".zip", ".tar", ".tar.gz", ".tgz", ".tar.xz", ".txz" })
    {
        if (name.ends_with(suffix))
            return true;
    }
    return false;
}

static int WriteData(archive *arc, const std::filesystem::path &destination)
{
    std::ofstream stream(destination, std::ios::binary | std::ios::trunc);
    if (!stream)
    {
        std::cerr << "failed to open " << destination.string() << " for writing." << std::endl;
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
                break;

            std::cerr << "failed to read archive data block: " << archive_error_string(arc) << std::endl;
            return error;
        }

        stream.seekp(off);
        stream.write(static_cast<const char *>(buf), static_cast<std::streamsize>(len));
        if (!stream)
        {
            std::cerr << "failed to write " << destination.string() << "." << std::endl;
            return 1;
        }
    }

    return 0;
}

int ExtractEntry(const std::filesystem::path &source, const std::string &entry_name, const std::filesystem::path &destination)
{
    const auto arc = archive_read_new();

    archive_read_support_format_all(arc);
    archive_read_support_filter_all(arc);

    const auto source_string = source.string();
    if (const auto error = archive_read_open_filename(arc, source_string.c_str(), 0x4000))
    {
        std::cerr << "failed to open archive: " << archive_error_string(arc) << std::endl;

        archive_read_free(arc);
        return error;
    }

    archive_entry *entry;

    int err;
    while (!((err = archive_read_next_header(arc, &entry))))
    {
        if (archive_entry_filetype(entry) != AE_IFREG)
            continue;

        const std::filesystem::path pathname(archive_entry_pathname(entry));
        if (pathname.filename().string() != entry_name)
            continue;

        const auto error = WriteData(arc, destination);

        archive_read_free(arc);
        return error;
    }

    if (err != ARCHIVE_EOF)
    {
        std::cerr << "failed to read archive header: " << archive_error_string(arc) << std::endl;

        archive_read_free(arc);
        return err;
    }

    std::cerr << "no entry named '" << entry_name << "' in " << source.string() << "." << std::endl;

    archive_read_free(arc);
    return 1;
}
