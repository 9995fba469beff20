// Copyright (c) 2026 UltiMaker
// KerfEngine is released under the terms of the AGPLv3 or higher

#ifndef APPLICATION_H
#define APPLICATION_H

#include <cstddef>
#include <filesystem>

#include "utils/NoCopy.h"

namespace kerf
{
class CommandLine;
struct EnclosureConfig;

/*!
 * A singleton class that serves as the starting point for all generation.
 *
 * The application sets up logging, reads the command line and runs the requested stages: writing the panel drawings
 * and laying them out on the material sheets.
 */
class Application : NoCopy
{
public:
    /*!
     * Gets the instance of this application class.
     */
    static Application& getInstance();

    /*!
     * \brief Print to the stdout channel how to use KerfEngine.
     */
    void printHelp() const;

    /*!
     * \brief Starts the application.
     *
     * \param argc The number of arguments provided to the application.
     * \param argv The arguments provided to the application.
     * \throws std::exception (or a subclass) when anything goes wrong; nothing is caught here.
     */
    void run(const size_t argc, char** argv);

protected:
    /*!
     * \brief Print the header and license to the stdout channel.
     */
    void printLicense() const;

    /*!
     * Write the eight panel drawings and the review page into \p output_directory.
     */
    void writePanels(const EnclosureConfig& config, const std::filesystem::path& output_directory) const;

    /*!
     * Read the panel drawings back from \p output_directory and write the sheet layouts and their DXF files.
     */
    void nestPanels(const EnclosureConfig& config, const std::filesystem::path& output_directory) const;

private:
    /*!
     * \brief Constructs a new Application instance.
     *
     * You cannot call this because this goes via the getInstance() function.
     */
    Application();

    ~Application() = default;
};

} // namespace kerf

#endif // APPLICATION_H
