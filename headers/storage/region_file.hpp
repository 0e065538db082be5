#ifndef BASALT_REGION_FILE_HPP
#define BASALT_REGION_FILE_HPP


#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "storage/chunk_store.hpp"

#define REGION_SECTOR_SIZE (4096)
#define REGION_HEADER_SIZE (2 * REGION_SECTOR_SIZE)
#define REGION_CHUNKS (1024)
/**
 * Set in the scheme byte when the chunk lives in a separate .mcc file.
 */
#define REGION_EXTERNAL_FLAG (0x80)

/**
 * One region entry that could not be imported.
 */
struct ImportWarning
{
    /**
     * Region-local index (local x + 32 * local z), or -1 for a problem with the whole file.
     */
    int index;
    std::string reason;
};

struct ImportReport
{
    size_t imported = 0;
    std::vector<ImportWarning> warnings;
};

/**
 * Parses r.<x>.<z>.mca (directories in front are ignored).
 * @return false if the name does not have that form.
 */
bool parse_region_name(const std::string& path, int32_t& rx, int32_t& rz);

/**
 * Copies every valid chunk of a legacy region file into the store with one batch, recompressed
 * with the store's scheme. Absent entries are skipped; broken entries become warnings and do not
 * stop the import.
 *
 * @throws StoreException if the file cannot be read or the batch cannot be written
 */
ImportReport import_region_file(ChunkStore& store, const std::string& path, const std::string& dimension);

/**
 * Imports every *.mca file in dir.
 */
ImportReport import_region_directory(ChunkStore& store, const std::string& dir, const std::string& dimension);


#endif //BASALT_REGION_FILE_HPP
