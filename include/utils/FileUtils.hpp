#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>
#include <vector>

/**
 * @brief Small filesystem helpers shared by the configuration readers and the CLI.
 */
class FileUtils {
public:
    /**
     * @brief Join two path fragments with exactly one separator.
     */
    static std::string joinPaths(const std::string& base, const std::string& relative);

    /**
     * @brief Locate the project root.
     *
     * Uses the CTSAFETY_ROOT environment variable when set, otherwise walks up from the
     * current working directory until a directory containing data/configuration is found.
     * Falls back to the current working directory.
     */
    static std::string getProjectRoot();

    static bool fileExists(const std::string& path);

    /**
     * @brief Read all non-empty lines, stripping '#' comments and surrounding whitespace.
     * @throws ctsafety::FileIOException if the file cannot be opened.
     */
    static std::vector<std::string> readContentLines(const std::string& path);

    static std::string trim(const std::string& s);
    static std::vector<std::string> split(const std::string& s, char delimiter);
};

#endif // FILE_UTILS_HPP
