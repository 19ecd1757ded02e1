#include "common.h"


lacq::run_artifacts::run_artifacts(const stdfs::path& destination, const std::string& container_name)
    : destination(destination),
      container_name(container_name),
      container_file(destination / (container_name + artifact_extensions::CONTAINER)),
      transcript(destination / (container_name + artifact_extensions::TRANSCRIPT)),
      transfer_log(destination / (container_name + artifact_extensions::TRANSFER_LOG)),
      error_log(destination / (container_name + artifact_extensions::ERROR_LOG)),
      summary(destination / (container_name + artifact_extensions::SUMMARY))
{ }

std::vector<stdfs::path> lacq::run_artifacts::all() const
{
    return { container_file, transcript, transfer_log, error_log, summary };
}
