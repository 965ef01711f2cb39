#define WIFI_SSID_H "__SSID__"
#define WIFI_PASSWORD_H "__PASSWORD__"

// WebSocket サーバ設定
#define SERVER_HOST_H "192.168.1.179"   // 例: サーバのIP
#define SERVER_PORT_H 8000              // 例: FastAPIのポート
#define SERVER_PATH_H "/ws/stackchan"      // WebSocketパス

// オーディオ設定
#define MIC_SAMPLE_RATE_H 16000         // アップリンク (マイク) サンプルレート
#define REPLY_SAMPLE_RATE_H 24000       // 返答音声のデフォルトサンプルレート (START meta で上書き)
#define SPEAKER_VOLUME_H 200            // 0-255
