// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_HOSTD_HEADLESS_H
#define NR_HOSTD_HEADLESS_H

namespace host {
namespace headless {

/**
 * @brief Parse the command line and start the host
 *
 * @return false if the host couldn't be started
 */
bool start();

}
}

#endif
