#if !defined(_LACQ_COMMON_H_INCLUDED_)
#define _LACQ_COMMON_H_INCLUDED_

#include "infra/infra.h"

#include "errors.h"
#include "run_config.h"
#include "artifacts.h"
#include "tool_output.h"
#include "host_tools.h"
#include "input_provider.h"
#include "backup.h"
#include "locator.h"
#include "container.h"
#include "provisioner.h"
#include "transfer.h"
#include "finalizer.h"
#include "summary.h"
#include "supervisor.h"
#include "program_options.h"


#endif  // !defined(_LACQ_COMMON_H_INCLUDED_)
