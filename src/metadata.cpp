// Standard includes
#include <string>

// Local includes
#include "logger.hpp"
#include "metadata.hpp"
#include "params.hpp"

/**
 * @brief Parse and set all the run-wide metadata.
 *
 * Note that some metadata is attached elsewhere in parseCmdArgs (rank,
 * threads, verbosity and possibly the sample count).
 *
 * @param params The parameters for the run
 */
void readMetadata(Parameters *params) {

  tic();

  // Get the metadata instance
  Metadata *metadata = &Metadata::getInstance();

  // The command line sample count wins over the parameter file
  if (metadata->nsamples <= 0) {
    metadata->nsamples = params->getParameter<int>("Run/nsamples", 1);
  }
  if (metadata->nsamples <= 0) {
    config_error("Run/nsamples must be positive (got %d)", metadata->nsamples);
  }

  // Do we want the reproducibility check?
  metadata->check_reproducibility = static_cast<bool>(
      params->getParameter<int>("Run/check_reproducibility", 0));

  // Where are the (optional) reference maps?
  if (params->exists("Input/reference_file")) {
    metadata->reference_file =
        params->getParameterNoDefault<std::string>("Input/reference_file");
    metadata->reference_dataset = params->getParameterString(
        "Input/reference_dataset", "Maps_Mcdm");
    message("Matching map statistics to: %s",
            metadata->reference_file.c_str());
  }

  // Get the output file path
  metadata->output_file = getOutputFilePath(params, metadata->rank);

  message("Writing maps to: %s", metadata->output_file.c_str());

  toc("Reading metadata");
}
