// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/net/chunkedtransport.h"
#include "libshared/net/peerchannel.h"
#include <QJsonDocument>
#include <QTimer>

namespace net {

namespace {
const QString KEY_TYPE = QStringLiteral("type");
const QString KEY_CAT = QStringLiteral("cat");
const QString KEY_CHUNK = QStringLiteral("chunk");
const QString KEY_END = QStringLiteral("end");
const QString KEY_SEQ = QStringLiteral("seq");
const QString TYPE_PART = QStringLiteral("PART");
}

QVector<QJsonObject> makeFrames(
	const QString &category, const QString &text, const QJsonObject &meta)
{
	QVector<QJsonObject> frames;
	frames.reserve(text.length() / CHUNK_SIZE + 1);

	const int total = text.length();
	int offset = 0;
	int seq = 0;
	do {
		int len = qMin(CHUNK_SIZE, total - offset);
		if(offset + len < total && len > 1 &&
		   text.at(offset + len - 1).isHighSurrogate()) {
			--len;
		}

		QJsonObject frame = meta;
		frame[KEY_TYPE] = TYPE_PART;
		frame[KEY_CAT] = category;
		frame[KEY_CHUNK] = text.mid(offset, len);
		frame[KEY_SEQ] = seq++;
		offset += len;
		frame[KEY_END] = offset >= total;
		frames.append(frame);
	} while(offset < total);

	return frames;
}

QVector<QJsonObject> makeFrames(const Envelope &envelope)
{
	return makeFrames(
		envelope.type, Envelope::serializePayload(envelope.payload),
		envelope.meta);
}

bool isFrame(const QJsonObject &obj)
{
	return obj.value(KEY_TYPE).toString() == TYPE_PART;
}

Reassembler::Reassembler(qint64 maxBuffered, int maxPending)
	: m_bufferedSize(0)
	, m_maxBuffered(maxBuffered)
	, m_maxPending(qMax(1, maxPending))
{
}

QString Reassembler::keyFor(const QString &category, const QJsonObject &frame)
{
	const QJsonValue requestId = frame.value(QStringLiteral("requestId"));
	if(requestId.isUndefined() || requestId.isNull())
		return category;
	return category + QChar(0x1f) + Envelope::serializePayload(requestId);
}

QJsonObject Reassembler::metaOf(const QJsonObject &frame)
{
	QJsonObject meta = frame;
	meta.remove(KEY_TYPE);
	meta.remove(KEY_CAT);
	meta.remove(KEY_CHUNK);
	meta.remove(KEY_END);
	meta.remove(KEY_SEQ);
	return meta;
}

void Reassembler::discard(const QString &key)
{
	const auto i = m_partials.find(key);
	if(i != m_partials.end()) {
		m_bufferedSize -= i->text.length() + i->overhead;
		m_partials.erase(i);
	}
}

Reassembler::Status
Reassembler::drop(const QString &key, bool lastFrame, Status status)
{
	discard(key);
	if(!lastFrame && m_discarded.size() < m_maxPending)
		m_discarded.insert(key);
	return status;
}

Reassembler::Status Reassembler::addFrame(const QJsonObject &frame)
{
	const QJsonValue cat = frame.value(KEY_CAT);
	const QJsonValue chunk = frame.value(KEY_CHUNK);
	if(!isFrame(frame) || !cat.isString() || !chunk.isString()) {
		m_error = QStringLiteral("malformed frame");
		return Status::BadFrame;
	}

	const QString category = cat.toString();
	const QString key = keyFor(category, frame);
	const QString text = chunk.toString();
	const QJsonValue seq = frame.value(KEY_SEQ);
	const bool lastFrame = frame.value(KEY_END).toBool();

	if(m_discarded.contains(key)) {
		// A fresh first frame starts a new message under the same key
		if(seq.isUndefined() || seq.toInt(-1) != 0) {
			if(lastFrame)
				m_discarded.remove(key);
			return Status::Ignored;
		}
		m_discarded.remove(key);
	}

	auto i = m_partials.find(key);
	if(i == m_partials.end()) {
		const QJsonObject meta = metaOf(frame);
		const qint64 overhead =
			key.length() + Envelope::serializePayload(meta).length();

		if(!seq.isUndefined() && seq.toInt(-1) != 0) {
			m_error = QStringLiteral("frame %1 of '%2' arrived without its "
									 "predecessors")
						  .arg(seq.toInt(-1))
						  .arg(category);
			return drop(key, lastFrame, Status::Gap);
		}

		if(m_bufferedSize + overhead + text.length() > m_maxBuffered) {
			m_error = QStringLiteral("message '%1' exceeds reassembly limit "
									 "of %2 characters")
						  .arg(category)
						  .arg(m_maxBuffered);
			return drop(key, lastFrame, Status::TooLarge);
		}

		if(lastFrame) {
			m_complete = Message{category, text, meta};
			return Status::Complete;
		}

		if(m_partials.size() >= m_maxPending) {
			m_error = QStringLiteral("too many unfinished messages (limit %1)")
						  .arg(m_maxPending);
			return drop(key, lastFrame, Status::TooLarge);
		}

		i = m_partials.insert(key, Partial{QString(), 0, overhead, meta});
		m_bufferedSize += overhead;

	} else if(!seq.isUndefined() && seq.toInt(-1) != i->nextSeq) {
		m_error = QStringLiteral("frame %1 of '%2' arrived out of sequence "
								 "(expected %3)")
					  .arg(seq.toInt(-1))
					  .arg(category)
					  .arg(i->nextSeq);
		return drop(key, lastFrame, Status::Gap);

	} else if(m_bufferedSize + text.length() > m_maxBuffered) {
		m_error = QStringLiteral("message '%1' exceeds reassembly limit of "
								 "%2 characters")
					  .arg(category)
					  .arg(m_maxBuffered);
		return drop(key, lastFrame, Status::TooLarge);
	}

	i->text.append(text);
	++i->nextSeq;
	m_bufferedSize += text.length();

	if(!lastFrame)
		return Status::Incomplete;

	m_complete = Message{category, i->text, i->meta};
	discard(key);
	return Status::Complete;
}

Reassembler::Message Reassembler::takeMessage()
{
	Message m = m_complete;
	m_complete = Message();
	return m;
}

void Reassembler::clear()
{
	m_partials.clear();
	m_discarded.clear();
	m_complete = Message();
	m_bufferedSize = 0;
}

FrameSender::FrameSender(PeerChannel *channel, QObject *parent)
	: QObject(parent)
	, m_channel(channel)
	, m_timer(new QTimer(this))
{
	m_timer->setSingleShot(true);
	m_timer->setInterval(DEFAULT_FRAME_INTERVAL);
	connect(m_timer, &QTimer::timeout, this, &FrameSender::sendNext);
}

void FrameSender::setInterval(int msecs)
{
	m_timer->setInterval(qMax(0, msecs));
}

int FrameSender::interval() const
{
	return m_timer->interval();
}

void FrameSender::enqueue(const QVector<QJsonObject> &frames)
{
	const bool wasIdle = m_queue.isEmpty();
	for(const QJsonObject &frame : frames)
		m_queue.enqueue(QJsonDocument(frame).toJson(QJsonDocument::Compact));

	if(wasIdle && !m_queue.isEmpty())
		sendNext();
}

void FrameSender::clear()
{
	m_queue.clear();
	m_timer->stop();
}

void FrameSender::sendNext()
{
	if(m_queue.isEmpty())
		return;

	if(m_channel->state() != PeerChannel::State::Open) {
		const int dropped = m_queue.size();
		m_queue.clear();
		emit sendFailed(
			QStringLiteral("channel not open, dropped %1 frames").arg(dropped));
		return;
	}

	const QByteArray frame = m_queue.dequeue();
	QString error;
	if(!m_channel->sendMessage(frame, &error)) {
		m_queue.clear();
		emit sendFailed(error);
		return;
	}

	if(m_queue.isEmpty())
		emit allSent();
	else
		m_timer->start();
}

}
