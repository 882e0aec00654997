#include "kindle2md/document_converter.h"

#include "kindle2md/notebook_parser.h"
#include "kindle2md/notebook_renderer.h"
#include "kindle2md/text_utils.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

extern "C"
{
#include "miniz.h"
}

namespace kindle2md
{
namespace detail
{
using ByteBuffer = std::vector<uint8_t>;

static std::string readBinaryFile(const std::string &path)
{
    std::ifstream stream(path.c_str(), std::ios::binary);
    if (!stream) return {};
    return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

static std::string readTextFile(const std::string &path)
{
    std::ifstream stream(path.c_str(), std::ios::binary);
    if (!stream) return {};
    std::ostringstream oss;
    oss << stream.rdbuf();
    return oss.str();
}

static bool isHtmlName(const std::string &name)
{
    return endsWithIgnoreCase(name, ".html") || endsWithIgnoreCase(name, ".htm");
}

class ZipArchive
{
public:
    ZipArchive() { std::memset(&m_archive, 0, sizeof(m_archive)); }
    ~ZipArchive() { close(); }

    ZipArchive(const ZipArchive &) = delete;
    ZipArchive &operator=(const ZipArchive &) = delete;

    bool open(const std::string &path)
    {
        close();
        const std::string bytes = readBinaryFile(path);
        if (bytes.empty()) return false;
        m_storage.assign(bytes.begin(), bytes.end());
        if (!mz_zip_reader_init_mem(&m_archive, m_storage.data(), m_storage.size(), 0))
        {
            close();
            return false;
        }
        m_open = true;
        return true;
    }

    std::string fileContent(const std::string &name) const
    {
        if (!m_open) return {};
        const int index = mz_zip_reader_locate_file(&m_archive, name.c_str(), nullptr, 0);
        if (index < 0) return {};
        size_t outSize = 0;
        void *ptr = mz_zip_reader_extract_to_heap(&m_archive, static_cast<mz_uint>(index), &outSize, 0);
        if (!ptr || outSize == 0)
        {
            if (ptr) mz_free(ptr);
            return {};
        }
        std::string data(static_cast<const char *>(ptr), static_cast<size_t>(outSize));
        mz_free(ptr);
        return data;
    }

    // Sorted names of the file entries whose name ends with an HTML extension.
    std::vector<std::string> htmlEntries() const
    {
        std::vector<std::string> names;
        if (!m_open) return names;
        const int count = static_cast<int>(mz_zip_reader_get_num_files(&m_archive));
        for (int i = 0; i < count; ++i)
        {
            if (mz_zip_reader_is_file_a_directory(&m_archive, static_cast<mz_uint>(i))) continue;
            mz_zip_archive_file_stat statRecord;
            if (!mz_zip_reader_file_stat(&m_archive, static_cast<mz_uint>(i), &statRecord))
                continue;
            const std::string name = statRecord.m_filename;
            if (isHtmlName(name)) names.push_back(name);
        }
        std::sort(names.begin(), names.end());
        return names;
    }

private:
    void close()
    {
        if (m_open)
        {
            mz_zip_reader_end(&m_archive);
            m_open = false;
        }
        m_storage.clear();
    }

    mutable mz_zip_archive m_archive;
    ByteBuffer m_storage;
    bool m_open = false;
};

static std::string renderNotebooks(const std::vector<Notebook> &notebooks, const ConversionOptions &options)
{
    if (options.format == OutputFormat::Xml) return renderXml(notebooks);
    std::vector<std::string> reports;
    for (const Notebook &notebook : notebooks)
        reports.push_back(renderMarkdown(notebook));
    return join(reports, "\n\n");
}

static ConversionResult convertArchive(const std::string &path, const ConversionOptions &options)
{
    ConversionResult result;
    ZipArchive zip;
    if (!zip.open(path))
    {
        result.warnings.push_back("Cannot open archive: " + path);
        return result;
    }
    const std::vector<std::string> entries = zip.htmlEntries();
    if (entries.empty())
    {
        result.warnings.push_back("No HTML entries in archive: " + path);
        return result;
    }

    for (const std::string &entry : entries)
    {
        const std::string html = zip.fileContent(entry);
        if (html.empty())
        {
            result.warnings.push_back("Cannot extract archive entry: " + path + ":" + entry);
            continue;
        }
        ConversionResult part = convertHtml(html, options, path + ":" + entry);
        result.success = result.success || part.success;
        result.warnings.insert(result.warnings.end(), part.warnings.begin(), part.warnings.end());
        std::move(part.notebooks.begin(), part.notebooks.end(), std::back_inserter(result.notebooks));
    }
    if (!result.notebooks.empty()) result.output = renderNotebooks(result.notebooks, options);
    return result;
}

} // namespace detail

ConversionResult convertHtml(const std::string &html, const ConversionOptions &options, const std::string &sourceName)
{
    ConversionResult result;
    ParseStats stats;
    Notebook notebook = parseNotebookHtml(html, stats);

    if (stats.wholeDocumentFallback && !notebook.highlights.empty())
        result.warnings.push_back("No highlight blocks recognized, using the whole document text: " + sourceName);
    if (stats.orphanNotes)
        result.warnings.push_back(std::to_string(stats.orphanNotes) + " note(s) without a preceding highlight kept as entries: " + sourceName);

    result.success = !notebook.highlights.empty();
    if (!result.success)
        result.warnings.push_back("No highlights found: " + sourceName);

    result.output = options.format == OutputFormat::Xml ? renderXml(notebook) : renderMarkdown(notebook);
    result.notebooks.push_back(std::move(notebook));
    return result;
}

ConversionResult convertFile(const std::string &path, const ConversionOptions &options)
{
    const std::string lowerPath = detail::toLower(path);
    const auto dot = lowerPath.find_last_of('.');
    const std::string extension = dot == std::string::npos ? "" : lowerPath.substr(dot);

    if (extension == ".zip")
        return detail::convertArchive(path, options);

    ConversionResult result;
    if (extension != ".html" && extension != ".htm")
    {
        result.warnings.push_back("Unsupported file type: " + path);
        return result;
    }
    const std::string html = detail::readTextFile(path);
    if (html.empty())
    {
        result.warnings.push_back("Cannot read file or file is empty: " + path);
        return result;
    }
    return convertHtml(html, options, path);
}

ConversionResult convertFiles(const std::vector<std::string> &paths, const ConversionOptions &options)
{
    ConversionResult result;
    result.success = !paths.empty();
    for (const std::string &path : paths)
    {
        ConversionResult part = convertFile(path, options);
        result.warnings.insert(result.warnings.end(), part.warnings.begin(), part.warnings.end());
        if (!part.success)
        {
            result.warnings.push_back("Failed to convert file: " + path);
            result.success = false;
            continue;
        }
        std::move(part.notebooks.begin(), part.notebooks.end(), std::back_inserter(result.notebooks));
    }
    if (!result.notebooks.empty()) result.output = detail::renderNotebooks(result.notebooks, options);
    return result;
}

} // namespace kindle2md
