/**
 * @file hdf_io.hpp
 * @brief Header file for the HDF5 I/O helper class and the map file
 * readers/writers built on it.
 */
#ifndef HDF_IO_H_
#define HDF_IO_H_

// Standard includes
#include <array>
#include <cstdint>
#include <hdf5.h> // HDF5 C API
#include <numeric>
#include <string>
#include <vector>

// Local includes
#include "logger.hpp"
#include "projector.hpp"
#include "sim_config.hpp"
#include "simulation.hpp"

/**
 * @brief Serial HDF5 helper class.
 *
 * Wraps a single open file. Every failure is raised through the error macro
 * so a helper call either succeeds or throws. The file is closed when the
 * helper goes out of scope.
 */
class HDF5Helper {
public:
  hid_t file_id; ///< HDF5 file identifier

  /**
   * @brief Constructor for HDF5 helper object
   *
   * @param filename The name of the HDF5 file to open/create
   * @param accessMode The file access mode (H5F_ACC_RDONLY, H5F_ACC_RDWR,
   * H5F_ACC_TRUNC, etc.)
   */
  HDF5Helper(const std::string &filename,
             unsigned int accessMode = H5F_ACC_RDONLY);

  /**
   * @brief Destructor - ensures proper cleanup
   */
  ~HDF5Helper();

  HDF5Helper(const HDF5Helper &) = delete;
  HDF5Helper &operator=(const HDF5Helper &) = delete;

  /**
   * @brief Manually close the HDF5 file
   */
  void close();

  /**
   * @brief Create a group in the HDF5 file
   * @param groupName Name of the group to create
   */
  void createGroup(const std::string &groupName);

  /**
   * @brief Does a link (group or dataset) with this name exist?
   * @param name Path of the link relative to the file root
   */
  bool exists(const std::string &name);

  /**
   * @brief Read an attribute from an HDF5 object
   * @tparam T Data type of the attribute
   * @param objName Name of the object containing the attribute
   * @param attributeName Name of the attribute
   * @param attributeValue Reference to store the attribute value
   */
  template <typename T>
  void readAttribute(const std::string &objName,
                     const std::string &attributeName, T &attributeValue);

  /**
   * @brief Write a scalar attribute to an HDF5 object
   * @tparam T Data type of the attribute
   * @param objName Name of the object to attach the attribute to
   * @param attributeName Name of the attribute
   * @param attributeValue Value to write
   */
  template <typename T>
  void writeAttribute(const std::string &objName,
                      const std::string &attributeName,
                      const T &attributeValue);

  /**
   * @brief Read a complete dataset
   * @tparam T Data type to convert the elements to
   * @param datasetName Name of the dataset
   * @param data Vector to store the (flattened, row-major) data
   * @param dims The shape of the dataset
   */
  template <typename T>
  void readDataset(const std::string &datasetName, std::vector<T> &data,
                   std::vector<hsize_t> &dims);

  /**
   * @brief Create an empty dataset with specified dimensions
   * @tparam T Data type of dataset elements
   * @tparam Rank Number of dimensions
   * @param datasetName Name of the dataset
   * @param dims Dimensions of the dataset
   */
  template <typename T, std::size_t Rank>
  void createDataset(const std::string &datasetName,
                     const std::array<hsize_t, Rank> &dims);

  /**
   * @brief Write a complete dataset
   * @tparam T Data type of dataset elements
   * @tparam Rank Number of dimensions
   * @param datasetName Name of the dataset
   * @param data Data to write
   * @param dims Dimensions of the dataset
   */
  template <typename T, std::size_t Rank>
  void writeDataset(const std::string &datasetName, const std::vector<T> &data,
                    const std::array<hsize_t, Rank> &dims);

  /**
   * @brief Write a slice of data to an existing dataset
   * @tparam T Data type of dataset elements
   * @tparam Rank Number of dimensions
   * @param datasetName Name of the dataset
   * @param data Data to write
   * @param start Starting indices for the hyperslab
   * @param count Size of the hyperslab in each dimension
   */
  template <typename T, std::size_t Rank>
  void writeDatasetSlice(const std::string &datasetName,
                         const std::vector<T> &data,
                         const std::array<hsize_t, Rank> &start,
                         const std::array<hsize_t, Rank> &count);

private:
  bool file_open; ///< Track if file is open
  std::string filename; ///< For error messages

  /**
   * @brief Map C++ types to HDF5 native types
   * @tparam T C++ data type
   * @return Corresponding HDF5 native type
   */
  template <typename T> hid_t getHDF5Type();

  /**
   * @brief Validate that a slice is within dataset bounds
   */
  template <std::size_t Rank>
  void validateSliceBounds(hid_t dataset_id, const std::string &datasetName,
                           const std::array<hsize_t, Rank> &start,
                           const std::array<hsize_t, Rank> &count);
};

// Type mappings (defined in hdf_io.cpp)
template <> hid_t HDF5Helper::getHDF5Type<int>();
template <> hid_t HDF5Helper::getHDF5Type<uint64_t>();
template <> hid_t HDF5Helper::getHDF5Type<float>();
template <> hid_t HDF5Helper::getHDF5Type<double>();

// Prototypes for map output (implemented in output.cpp)
void writeMapFile(const std::string &filename, const SimulationConfig &config,
                  const std::vector<SimulationResult> &results);

// Prototypes for reference map input (implemented in input.cpp)
std::vector<SurfaceDensityMap> readReferenceMaps(const std::string &filename,
                                                 const std::string &dataset);
MapStatistics referenceStatistics(const std::vector<SurfaceDensityMap> &maps);

// Template implementations

template <typename T>
void HDF5Helper::readAttribute(const std::string &objName,
                               const std::string &attributeName,
                               T &attributeValue) {
  if (!file_open) {
    error("Cannot read attribute: %s is not open", filename.c_str());
  }

  hid_t obj_id = H5Oopen(file_id, objName.c_str(), H5P_DEFAULT);
  if (obj_id < 0) {
    error("Failed to open object '%s' in %s", objName.c_str(),
          filename.c_str());
  }

  hid_t attr_id = H5Aopen(obj_id, attributeName.c_str(), H5P_DEFAULT);
  if (attr_id < 0) {
    H5Oclose(obj_id);
    error("Failed to open attribute '%s' in object '%s'", attributeName.c_str(),
          objName.c_str());
  }

  herr_t status = H5Aread(attr_id, getHDF5Type<T>(), &attributeValue);

  H5Aclose(attr_id);
  H5Oclose(obj_id);

  if (status < 0) {
    error("Failed to read attribute '%s' from object '%s'",
          attributeName.c_str(), objName.c_str());
  }
}

template <typename T>
void HDF5Helper::writeAttribute(const std::string &objName,
                                const std::string &attributeName,
                                const T &attributeValue) {
  if (!file_open) {
    error("Cannot write attribute: %s is not open", filename.c_str());
  }

  hid_t obj_id = H5Oopen(file_id, objName.c_str(), H5P_DEFAULT);
  if (obj_id < 0) {
    error("Failed to open object '%s' in %s", objName.c_str(),
          filename.c_str());
  }

  hid_t dataspace_id = H5Screate(H5S_SCALAR);
  if (dataspace_id < 0) {
    H5Oclose(obj_id);
    error("Failed to create dataspace for attribute '%s'",
          attributeName.c_str());
  }

  hid_t attr_id = H5Acreate(obj_id, attributeName.c_str(), getHDF5Type<T>(),
                            dataspace_id, H5P_DEFAULT, H5P_DEFAULT);
  if (attr_id < 0) {
    H5Sclose(dataspace_id);
    H5Oclose(obj_id);
    error("Failed to create attribute '%s' in object '%s'",
          attributeName.c_str(), objName.c_str());
  }

  herr_t status = H5Awrite(attr_id, getHDF5Type<T>(), &attributeValue);

  H5Aclose(attr_id);
  H5Sclose(dataspace_id);
  H5Oclose(obj_id);

  if (status < 0) {
    error("Failed to write attribute '%s' to object '%s'",
          attributeName.c_str(), objName.c_str());
  }
}

template <typename T>
void HDF5Helper::readDataset(const std::string &datasetName,
                             std::vector<T> &data, std::vector<hsize_t> &dims) {
  if (!file_open) {
    error("Cannot read dataset: %s is not open", filename.c_str());
  }

  hid_t dataset_id = H5Dopen(file_id, datasetName.c_str(), H5P_DEFAULT);
  if (dataset_id < 0) {
    error("Failed to open dataset '%s' in %s", datasetName.c_str(),
          filename.c_str());
  }

  hid_t dataspace_id = H5Dget_space(dataset_id);
  int rank = H5Sget_simple_extent_ndims(dataspace_id);
  if (rank < 0) {
    H5Sclose(dataspace_id);
    H5Dclose(dataset_id);
    error("Failed to get the shape of dataset '%s'", datasetName.c_str());
  }
  dims.assign(rank, 0);
  H5Sget_simple_extent_dims(dataspace_id, dims.data(), nullptr);

  hsize_t total_elements =
      std::accumulate(dims.begin(), dims.end(), static_cast<hsize_t>(1),
                      std::multiplies<hsize_t>());
  data.resize(total_elements);

  // HDF5 converts from the stored type to T on read
  herr_t status = H5Dread(dataset_id, getHDF5Type<T>(), H5S_ALL, H5S_ALL,
                          H5P_DEFAULT, data.data());

  H5Sclose(dataspace_id);
  H5Dclose(dataset_id);

  if (status < 0) {
    error("Failed to read dataset '%s'", datasetName.c_str());
  }
}

template <typename T, std::size_t Rank>
void HDF5Helper::createDataset(const std::string &datasetName,
                               const std::array<hsize_t, Rank> &dims) {
  if (!file_open) {
    error("Cannot create dataset: %s is not open", filename.c_str());
  }

  hid_t dataspace_id = H5Screate_simple(Rank, dims.data(), nullptr);
  if (dataspace_id < 0) {
    error("Failed to create dataspace for dataset '%s'", datasetName.c_str());
  }

  hid_t dataset_id =
      H5Dcreate(file_id, datasetName.c_str(), getHDF5Type<T>(), dataspace_id,
                H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);

  H5Sclose(dataspace_id);

  if (dataset_id < 0) {
    error("Failed to create dataset '%s'", datasetName.c_str());
  }

  H5Dclose(dataset_id);
}

template <typename T, std::size_t Rank>
void HDF5Helper::writeDataset(const std::string &datasetName,
                              const std::vector<T> &data,
                              const std::array<hsize_t, Rank> &dims) {

  // Verify data size matches dimensions
  hsize_t expected_size =
      std::accumulate(dims.begin(), dims.end(), static_cast<hsize_t>(1),
                      std::multiplies<hsize_t>());
  if (data.size() != expected_size) {
    error("Data size (%zu) doesn't match expected size (%llu) for dataset '%s'",
          data.size(), static_cast<unsigned long long>(expected_size),
          datasetName.c_str());
  }

  std::array<hsize_t, Rank> start;
  start.fill(0);

  createDataset<T, Rank>(datasetName, dims);
  if (expected_size > 0) {
    writeDatasetSlice<T, Rank>(datasetName, data, start, dims);
  }
}

template <typename T, std::size_t Rank>
void HDF5Helper::writeDatasetSlice(const std::string &datasetName,
                                   const std::vector<T> &data,
                                   const std::array<hsize_t, Rank> &start,
                                   const std::array<hsize_t, Rank> &count) {
  if (!file_open) {
    error("Cannot write dataset slice: %s is not open", filename.c_str());
  }

  // Verify data size matches slice size
  hsize_t expected_size =
      std::accumulate(count.begin(), count.end(), static_cast<hsize_t>(1),
                      std::multiplies<hsize_t>());
  if (data.size() != expected_size) {
    error("Data size (%zu) doesn't match slice size (%llu) for dataset '%s'",
          data.size(), static_cast<unsigned long long>(expected_size),
          datasetName.c_str());
  }

  hid_t dataset_id = H5Dopen(file_id, datasetName.c_str(), H5P_DEFAULT);
  if (dataset_id < 0) {
    error("Failed to open dataset '%s'", datasetName.c_str());
  }

  validateSliceBounds(dataset_id, datasetName, start, count);

  hid_t filespace_id = H5Dget_space(dataset_id);
  herr_t select_status =
      H5Sselect_hyperslab(filespace_id, H5S_SELECT_SET, start.data(), nullptr,
                          count.data(), nullptr);
  if (select_status < 0) {
    H5Sclose(filespace_id);
    H5Dclose(dataset_id);
    error("Failed to select hyperslab for dataset '%s'", datasetName.c_str());
  }

  hid_t memspace_id = H5Screate_simple(Rank, count.data(), nullptr);
  if (memspace_id < 0) {
    H5Sclose(filespace_id);
    H5Dclose(dataset_id);
    error("Failed to create memory space for dataset slice '%s'",
          datasetName.c_str());
  }

  herr_t status = H5Dwrite(dataset_id, getHDF5Type<T>(), memspace_id,
                           filespace_id, H5P_DEFAULT, data.data());

  H5Sclose(memspace_id);
  H5Sclose(filespace_id);
  H5Dclose(dataset_id);

  if (status < 0) {
    error("Failed to write slice to dataset '%s'", datasetName.c_str());
  }
}

template <std::size_t Rank>
void HDF5Helper::validateSliceBounds(hid_t dataset_id,
                                     const std::string &datasetName,
                                     const std::array<hsize_t, Rank> &start,
                                     const std::array<hsize_t, Rank> &count) {
  hid_t dataspace_id = H5Dget_space(dataset_id);
  int dataset_rank = H5Sget_simple_extent_ndims(dataspace_id);

  if (dataset_rank != static_cast<int>(Rank)) {
    H5Sclose(dataspace_id);
    H5Dclose(dataset_id);
    error("Dataset '%s' has rank %d, expected %zu", datasetName.c_str(),
          dataset_rank, Rank);
  }

  std::array<hsize_t, Rank> dims;
  H5Sget_simple_extent_dims(dataspace_id, dims.data(), nullptr);
  H5Sclose(dataspace_id);

  for (std::size_t i = 0; i < Rank; ++i) {
    if (start[i] + count[i] > dims[i]) {
      H5Dclose(dataset_id);
      error("Slice out of bounds in dimension %zu of '%s': start=%llu, "
            "count=%llu, dim=%llu",
            i, datasetName.c_str(), static_cast<unsigned long long>(start[i]),
            static_cast<unsigned long long>(count[i]),
            static_cast<unsigned long long>(dims[i]));
    }
  }
}

#endif // HDF_IO_H_
