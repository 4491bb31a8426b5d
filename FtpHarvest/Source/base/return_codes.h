// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef RETURN_CODES_H_81307482137054156
#define RETURN_CODES_H_81307482137054156

#include <hvk/i18n.h>


namespace fhv
{
enum FhvReturnCode //as returned after process exit
{
    FHV_RC_SUCCESS = 0,
    FHV_RC_WARNING,
    FHV_RC_ERROR,
    FHV_RC_ABORTED,
    FHV_RC_EXCEPTION,
};


inline
void raiseReturnCode(FhvReturnCode& rc, FhvReturnCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}


enum class HarvestResult
{
    finishedSuccess,
    finishedWarning,
    finishedError,
    aborted,
};


inline
FhvReturnCode mapToReturnCode(HarvestResult result)
{
    switch (result)
    {
        case HarvestResult::finishedSuccess:
            return FHV_RC_SUCCESS;
        case HarvestResult::finishedWarning:
            return FHV_RC_WARNING;
        case HarvestResult::finishedError:
            return FHV_RC_ERROR;
        case HarvestResult::aborted:
            return FHV_RC_ABORTED;
    }
    assert(false);
    return FHV_RC_ABORTED;
}


inline
std::wstring getFinalStatusLabel(HarvestResult finalStatus)
{
    switch (finalStatus)
    {
        case HarvestResult::finishedSuccess:
            return _("Completed successfully");
        case HarvestResult::finishedWarning:
            return _("Completed with warnings");
        case HarvestResult::finishedError:
            return _("Completed with errors");
        case HarvestResult::aborted:
            return _("Stopped");
    }
    assert(false);
    return std::wstring();
}
}

#endif //RETURN_CODES_H_81307482137054156
