// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBWAVATAR_UTILS_NETWORKACCESS_H
#define LIBWAVATAR_UTILS_NETWORKACCESS_H

class QNetworkAccessManager;

namespace wavatar {
namespace networkaccess {

/**
 * @brief Network access manager of the calling thread
 *
 * Layers are fetched synchronously from whichever thread generates the
 * avatar, so every thread gets a manager of its own. It is created on
 * first use and deleted when the thread finishes.
 */
QNetworkAccessManager *threadManager();

//! Number of threads that currently have a manager
int managerCount();

}
}

#endif
