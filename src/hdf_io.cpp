/**
 * @file hdf_io.cpp
 * @brief Implementation of the serial HDF5 I/O helper class
 */

// Standard includes
#include <cstdint>
#include <hdf5.h>
#include <string>

// Local includes
#include "hdf_io.hpp"
#include "logger.hpp"

/**
 * @brief Constructor for HDF5Helper
 *
 * @param filename The name of the HDF5 file to open/create
 * @param accessMode The file access mode
 *
 * @throw std::runtime_error If the file cannot be opened or created.
 */
HDF5Helper::HDF5Helper(const std::string &filename, unsigned int accessMode)
    : file_id(-1), file_open(false), filename(filename) {

  if (accessMode == H5F_ACC_RDONLY || accessMode == H5F_ACC_RDWR) {
    file_id = H5Fopen(filename.c_str(), accessMode, H5P_DEFAULT);
  } else {
    file_id = H5Fcreate(filename.c_str(), accessMode, H5P_DEFAULT, H5P_DEFAULT);
  }

  if (file_id < 0) {
    error("Failed to open/create HDF5 file: %s", filename.c_str());
  }

  file_open = true;
}

/**
 * @brief Destructor - ensures proper cleanup
 */
HDF5Helper::~HDF5Helper() {
  if (file_open) {
    close();
  }
}

/**
 * @brief Manually close the HDF5 file
 */
void HDF5Helper::close() {
  if (file_open && file_id >= 0) {
    H5Fclose(file_id);
    file_open = false;
  }
}

/**
 * @brief Create a group in the HDF5 file
 *
 * @param groupName Name of the group to create
 */
void HDF5Helper::createGroup(const std::string &groupName) {
  if (!file_open) {
    error("Cannot create group: %s is not open", filename.c_str());
  }

  hid_t group_id = H5Gcreate(file_id, groupName.c_str(), H5P_DEFAULT,
                             H5P_DEFAULT, H5P_DEFAULT);
  if (group_id < 0) {
    error("Failed to create group '%s' in %s", groupName.c_str(),
          filename.c_str());
  }
  H5Gclose(group_id);
}

/**
 * @brief Check whether a link exists at the root of the file
 *
 * @param name Name of the group or dataset
 * @return true if it exists, false otherwise
 */
bool HDF5Helper::exists(const std::string &name) {
  if (!file_open) {
    error("Cannot look up '%s': %s is not open", name.c_str(),
          filename.c_str());
  }
  return H5Lexists(file_id, name.c_str(), H5P_DEFAULT) > 0;
}

// Template specializations for HDF5 type mappings

template <> hid_t HDF5Helper::getHDF5Type<int>() { return H5T_NATIVE_INT; }

template <> hid_t HDF5Helper::getHDF5Type<uint64_t>() {
  return H5T_NATIVE_UINT64;
}

template <> hid_t HDF5Helper::getHDF5Type<float>() { return H5T_NATIVE_FLOAT; }

template <> hid_t HDF5Helper::getHDF5Type<double>() {
  return H5T_NATIVE_DOUBLE;
}
