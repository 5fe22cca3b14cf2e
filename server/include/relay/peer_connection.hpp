/*
 * 설명: 레지스트리와 디스패처가 전송 계층을 모른 채 연결에 쓰고 닫을 수 있게 하는 인터페이스.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 */
#pragma once

#include <string>

namespace relay {

class PeerConnection {
 public:
  virtual ~PeerConnection() = default;

  // 비동기 송신 큐에 메시지를 넣는다. 이미 닫히는 중이면 false.
  // 실제 쓰기 실패는 연결 자신이 처리하고 호출자에게 전파되지 않는다.
  virtual bool Send(std::string message) = 0;

  // 연결을 강제로 닫는다. 여러 번 호출해도 안전해야 한다.
  virtual void Close() = 0;
};

}  // namespace relay
