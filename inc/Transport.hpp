#pragma once

#include <functional>
#include <unordered_map>

#include "Contact.hpp"
#include "Errors.hpp"
#include "Extrinsic.hpp"

namespace pythia {

enum MessageType : u8 {
  eResult = 0x00, // u32 error code

  eQueryAccount = 0x10,
  eQueryOperator = 0x11,
  eQueryResult = 0x12,
  eSubmit = 0x13,
  eSubscribe = 0x14,
  eUnsubscribe = 0x15,
  eQueryRequest = 0x16,

  eAccountResult = 0x20,
  eOperatorResult = 0x21,
  eValueResult = 0x22,
  eSubmitted = 0x23,
  eSubscribed = 0x24,
  eRequestResult = 0x25,

  // Pushed by the node, never replied to
  eTxStatusPush = 0x30,
  eEventsPush = 0x31,
};
std::ostream &operator<<(std::ostream &pOS, MessageType pType);

/** Events push payload: [subscription u64][error u32][count u16][events]. A non zero error ends the subscription,
 * a block with more events than a datagram holds is split over several pushes. */
constexpr size_t sEventsPushHeader = 8 + 4 + 2;

struct inflight_t {
  using Callback = std::function<void(ErrorCode pError, const cbuff_view_t &pReply)>;
  net::deadline_timer timeout;
  MessageType type;
  Contact dest;
  Callback callback;

  inflight_t(net::io_service &pService, MessageType pType, Contact pDest, Callback pCallback);

  inflight_t(inflight_t &&pOther) = default;
};

/** Sealed datagram exchange shared by both ends of the node protocol.
 *
 * Datagram: [sender box PK 32][nonce 24][MAC 16][crypto_box of the body]
 * Body: [type 1][token 3][payload]
 *
 * Commands are matched to their reply by (peer, token) and time out after PYTHIA_TIMEOUT. */
class Transport {
protected:
  using udp = net::ip::udp;

  static constexpr size_t sBuffSize = 1280 - 40 - 8; // IPv6 MTU - IPv6 header - UDP header
  static constexpr size_t sHeaderSize = 72;          // ID + Nonce + Mac
  static constexpr size_t sNonceOffset = 32;
  static constexpr size_t sNonceSize = 24;
  static constexpr size_t sMacOffset = sNonceOffset + sNonceSize;
  static constexpr size_t sPayloadOffset = 4; // type + token
  static constexpr size_t sMaxBody = sBuffSize - sHeaderSize;
  static constexpr size_t sMaxPayload = sMaxBody - sPayloadOffset;
  static_assert(sMaxPayload - sEventsPushHeader >= sMaxEventSize);

  net::io_service &service;
  udp::socket sock;
  keypairs_t keypair;

  udp::endpoint lastDist;
  buff_t<sBuffSize> recvBuff;

  std::unordered_map<size_t, inflight_t> inflights;

  void send(const Contact &pDest, const cbuff_view_t &pBuff);
  void recieve();

  /** Commands and pushes, replies are routed to their inflight. May throw on ill-formed payloads. */
  virtual void handle(const Contact &pSource, const cbuff_view_t &pBuff) = 0;

  size_t prepareCommand(const Contact &pDest, MessageType pCommandType, u8 *pBuffer,
                        const inflight_t::Callback &pCallback);
  void prepareReply(MessageType pReplyType, const u8 *pCommandBuffer, u8 *pReplyBuffer);
  void replyWithResult(const Contact &pSource, const u8 *pCommandBuffer, PythiaErrorCode pError);
  void recvResponse(const Contact &pSource, const cbuff_view_t &pBuff);

  /** Body of a push, token is zero. */
  static void preparePush(MessageType pType, u8 *pBuffer);

  static bool isReply(MessageType pType);
  static size_t hashInflight(const u256 &pDest, uint32_t pToken);
  static uint32_t readToken(const u8 *pData);

public:
  Transport(net::io_service &pService, const keypairs_t &pKeypair, const udp::endpoint &pEndpoint);
  virtual ~Transport();

  Transport(const Transport &) = delete;
  Transport &operator=(const Transport &) = delete;

  Contact self() const;
  size_t inflightCount() const;
};

} // namespace pythia
