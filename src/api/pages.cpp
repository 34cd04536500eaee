#include "pages.hpp"


char const * const pages::pairingPrefix = "playsync:";


std::string pages::pairing(std::string const & token) {
    return R"(<!DOCTYPE html>
<html>
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>playsync - pairing</title>
</head>
<body>
<h1>playsync</h1>
<div id="qrcode"></div>
<p>Scan this code with a paired device, or confirm <code>)" + token + R"(</code> on the player.</p>
<p id="status">Waiting for confirmation...</p>
<script>
const payload = ')" + std::string(pairingPrefix) + token + R"(';
const script = document.createElement('script');
script.src = 'https://cdn.jsdelivr.net/npm/qrcode-generator@1.4.4/qrcode.min.js';
script.onload = () => {
    const qr = qrcode(0, 'M');
    qr.addData(payload);
    qr.make();
    document.getElementById('qrcode').innerHTML = qr.createSvgTag(6, 0);
};
document.head.appendChild(script);
setInterval(async () => {
    try {
        const response = await fetch('/check-session');
        if ((await response.json()).verified) window.location.href = '/app';
    } catch (e) {}
}, 1000);
</script>
</body>
</html>
)";
}

std::string pages::app(std::string const & localDevice) {
    return R"(<!DOCTYPE html>
<html>
<head>
<meta charset="UTF-8">
<title>playsync</title>
</head>
<body>
<h1>playsync</h1>
<p>Paired. Now playing on <span id="active">)" + localDevice + R"(</span>.</p>
<script>
const deviceId = localStorage.deviceId || (localStorage.deviceId = 'web:' + crypto.randomUUID());
const events = new EventSource('/player/events?deviceId=' + encodeURIComponent(deviceId));
events.onmessage = (event) => {
    document.getElementById('active').textContent = JSON.parse(event.data).activeDevice;
};
setInterval(() => fetch('/player/heartbeat', {
    method: 'POST',
    headers: {'Content-Type': 'application/x-www-form-urlencoded'},
    body: 'deviceId=' + encodeURIComponent(deviceId)
}), 5000);
</script>
</body>
</html>
)";
}
