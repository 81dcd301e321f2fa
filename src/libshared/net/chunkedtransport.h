// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef NR_SHARED_NET_CHUNKEDTRANSPORT_H
#define NR_SHARED_NET_CHUNKEDTRANSPORT_H
#include "libshared/net/envelope.h"
#include <QHash>
#include <QJsonObject>
#include <QObject>
#include <QQueue>
#include <QSet>
#include <QVector>

class QTimer;

namespace net {

class PeerChannel;

//! Maximum number of characters of serialized payload in one frame
static constexpr int CHUNK_SIZE = 16 * 1024;

//! Default pause between two consecutive outbound frames
static constexpr int DEFAULT_FRAME_INTERVAL = 5;

/**
 * @brief Split serialized payload text into PART frames
 *
 * Every frame looks like `{type: "PART", cat, chunk, end, seq, ...meta}`.
 * At least one frame is always produced, even for empty text. A chunk
 * boundary never separates the two halves of a surrogate pair.
 */
QVector<QJsonObject> makeFrames(
	const QString &category, const QString &text, const QJsonObject &meta);

//! Serialize the envelope's payload and split it into frames
QVector<QJsonObject> makeFrames(const Envelope &envelope);

//! Is this object a PART frame?
bool isFrame(const QJsonObject &obj);

/**
 * @brief Reassembles frames received from one peer
 *
 * Frames are buffered per category and correlation ID, so interleaved
 * frames belonging to different requests do not corrupt each other.
 *
 * Both the buffered text (including each partial message's key and
 * metadata) and the number of unfinished messages are bounded. A frame that
 * would exceed either limit discards the partial message it belongs to.
 * The remaining frames of a discarded message are then ignored until its
 * final frame arrives, so a peer learns about the failure only once.
 */
class Reassembler {
public:
	static constexpr qint64 DEFAULT_MAX_BUFFERED = 32 * 1024 * 1024;
	static constexpr int DEFAULT_MAX_PENDING = 16;

	enum class Status {
		Incomplete, // frame accepted, message not finished yet
		Complete,	// a whole message is ready, get it with takeMessage()
		BadFrame,	// frame was malformed
		Gap,		// a frame is missing, the partial message was dropped
		TooLarge,	// buffer or pending message limit exceeded
		Ignored,	// frame belongs to a message that was already dropped
	};

	struct Message {
		QString category;
		QString text;
		QJsonObject meta;
	};

	explicit Reassembler(
		qint64 maxBuffered = DEFAULT_MAX_BUFFERED,
		int maxPending = DEFAULT_MAX_PENDING);

	void setMaxBuffered(qint64 maxBuffered) { m_maxBuffered = maxBuffered; }
	qint64 maxBuffered() const { return m_maxBuffered; }

	void setMaxPending(int maxPending) { m_maxPending = qMax(1, maxPending); }
	int maxPending() const { return m_maxPending; }

	Status addFrame(const QJsonObject &frame);

	//! Take the message completed by the last addFrame call
	Message takeMessage();

	//! Number of buffered characters across all partial messages
	qint64 bufferedSize() const { return m_bufferedSize; }

	//! Number of unfinished messages
	int pendingCount() const { return m_partials.size(); }

	//! Number of dropped messages whose final frame hasn't arrived yet
	int discardedCount() const { return m_discarded.size(); }

	//! Description of the last BadFrame, Gap or TooLarge status
	QString errorString() const { return m_error; }

	void clear();

private:
	struct Partial {
		QString text;
		int nextSeq;
		qint64 overhead;
		QJsonObject meta;
	};

	static QString keyFor(const QString &category, const QJsonObject &frame);
	static QJsonObject metaOf(const QJsonObject &frame);
	void discard(const QString &key);
	Status drop(const QString &key, bool lastFrame, Status status);

	QHash<QString, Partial> m_partials;
	QSet<QString> m_discarded;
	Message m_complete;
	qint64 m_bufferedSize;
	qint64 m_maxBuffered;
	int m_maxPending;
	QString m_error;
};

/**
 * @brief Paced outbound frame queue
 *
 * Frames are sent in the order they were enqueued, with a short pause
 * between consecutive frames so the channel's send buffer doesn't
 * overflow. Frames of one envelope are always enqueued together, so
 * two responses never interleave on the wire.
 */
class FrameSender final : public QObject {
	Q_OBJECT
public:
	FrameSender(PeerChannel *channel, QObject *parent = nullptr);

	void setInterval(int msecs);
	int interval() const;

	void enqueue(const QVector<QJsonObject> &frames);

	int queuedFrames() const { return m_queue.size(); }
	bool isSending() const { return !m_queue.isEmpty(); }

	//! Drop all frames not sent yet
	void clear();

signals:
	void allSent();
	void sendFailed(const QString &message);

private slots:
	void sendNext();

private:
	PeerChannel *m_channel;
	QTimer *m_timer;
	QQueue<QByteArray> m_queue;
};

}

#endif
