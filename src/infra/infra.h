#if !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)
#define _LACQ_INFRA_INFRA_H_INCLUDED_

#include "predef.h"
#include "macro.h"

#include "logging.h"
#include "assertion.h"
#include "sweeper.h"
#include "disposable.h"

#include "subprocess.h"
#include "sighandle.h"


#endif  // !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)
