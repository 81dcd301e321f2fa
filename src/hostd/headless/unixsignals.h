// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef NR_HOSTD_UNIXSIGNALS_H
#define NR_HOSTD_UNIXSIGNALS_H

#include <QObject>

namespace host {

/**
 * @brief Turns UNIX signals into Qt signals
 *
 * The UNIX signal handler is installed when the first slot connects to
 * the corresponding Qt signal.
 */
class UnixSignals final : public QObject
{
	Q_OBJECT
public:
	static UnixSignals *instance();

signals:
	void sigInt();
	void sigTerm();
	void sigHup();  // refresh relay credentials
	void sigUsr1(); // check registration health

protected:
	void connectNotify(const QMetaMethod &signal) override;

private slots:
	void handleSignal();

private:
	UnixSignals();
};

}

#endif
