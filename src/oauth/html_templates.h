// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#pragma once

namespace oauthlink::oauth {

// Placeholders are %NAME% tokens filled by PageRenderer in a single pass.

// Terminal theme shared by every page
constexpr const char* kPageStyles = R"(
<style>
  html, body {
    margin: 0;
    min-height: 100vh;
    background: #000;
    color: #c0c0c0;
    font-family: 'Courier New', Consolas, monospace;
  }
  .crt { padding: 24px; }
  .bios-header {
    display: flex;
    justify-content: space-between;
    background: #0000aa;
    color: #fff;
    padding: 4px 12px;
  }
  .terminal { white-space: pre; font-size: 14px; line-height: 1.35; overflow-x: auto; }
  .mobile .terminal { font-size: 11px; }
  .amber { color: #ffb000; }
  .white { color: #fff; }
  .dim { color: #808080; }
  .cyan { color: #00ffff; }
  .yellow { color: #ffff55; }
  .ok { color: #55ff55; }
  .err { color: #ff5555; }
  .cursor::after { content: '_'; animation: blink 1s step-end infinite; }
  @keyframes blink { 50% { opacity: 0; } }
  .connect-section { margin-top: 24px; text-align: center; }
  .connect-btn {
    display: inline-block;
    padding: 10px 24px;
    border: 2px solid #ffb000;
    color: #ffb000;
    text-decoration: none;
  }
  .connect-btn:hover { background: #ffb000; color: #000; }
</style>
)";

constexpr const char* kPageShell = R"(<!DOCTYPE html>
<html lang="en">
<head>
  <meta charset="utf-8">
  <meta name="viewport" content="width=device-width, initial-scale=1">
  <title>OAUTHLINK BIOS - %TITLE%</title>
  %STYLES%
</head>
<body class="%VIEWPORT%">
  <div class="crt">
    <div class="bios-header">
      <span>OAUTHLINK BIOS SETUP UTILITY</span>
      <span class="timestamp">%TIMESTAMP%</span>
    </div>
    <pre class="terminal">%CONTENT%</pre>
    %FOOTER%
  </div>
</body>
</html>)";

constexpr const char* kConnectFooter = R"(<div class="connect-section">
      <a href="%AUTHORIZE_URL%" class="connect-btn">[ CONNECT ACCOUNT ]</a>
      <p><a href="/credits" class="dim">[C] Credits</a></p>
    </div>)";

constexpr const char* kHomeFooter = R"(<div class="connect-section">
      <a href="/" class="connect-btn">[ RETURN HOME ]</a>
    </div>)";

constexpr const char* kBootSequenceDesktop =
    R"(<span class="amber">+==============================================================================+</span>
<span class="amber">|</span>                           <span class="white">OAUTHLINK BIOS v%VERSION%</span>
<span class="amber">+==============================================================================+</span>

<span class="white">OAUTH AUTHENTICATION SYSTEM</span>

<span class="amber">POWER-ON SELF TEST</span>
<span class="dim">Provider Gateway......</span> <span class="cyan">ONLINE</span>                        [  <span class="ok">OK</span>  ]
<span class="dim">OAuth Module..........</span> <span class="cyan">Version 2.0</span>                   [  <span class="ok">OK</span>  ]
<span class="dim">Token Handler.........</span> <span class="cyan">READY</span>                         [  <span class="ok">OK</span>  ]
<span class="dim">User Store............</span> <span class="cyan">%STORE_STATE%</span>

<span class="dim">Loading OAuth Handler.............</span> [<span class="ok">####################</span>] <span class="white">100%</span>
<span class="dim">Preparing Authorization Flow......</span> [<span class="ok">####################</span>] <span class="white">100%</span>

<span class="amber">READY FOR AUTHENTICATION</span>
Press <span class="white">CONNECT</span> to authorize your account.

<span class="dim">C:\OAUTH></span><span class="cursor"></span>)";

constexpr const char* kBootSequenceMobile =
    R"(<span class="amber">+===================================+</span>
<span class="amber">|</span>   <span class="white">OAUTHLINK BIOS v%VERSION%</span>
<span class="amber">+===================================+</span>

<span class="white">OAUTH AUTH SYSTEM</span>

<span class="dim">Gateway....</span> <span class="cyan">ONLINE</span> [<span class="ok">OK</span>]
<span class="dim">OAuth......</span> <span class="cyan">v2.0</span>   [<span class="ok">OK</span>]
<span class="dim">Store......</span> <span class="cyan">%STORE_STATE%</span>

<span class="amber">READY</span>
Press <span class="white">CONNECT</span> to authorize.

<span class="dim">C:\OAUTH></span><span class="cursor"></span>)";

constexpr const char* kSuccessSequence =
    R"(<span class="white">OAUTH AUTHENTICATION SYSTEM</span>

<span class="dim">Processing Authorization Code.....</span> [<span class="ok">####################</span>] <span class="white">100%</span>
<span class="dim">Exchanging Token..................</span> [<span class="ok">####################</span>] <span class="cyan">OK</span>
<span class="dim">Fetching User Data................</span> [<span class="ok">####################</span>] <span class="cyan">OK</span>

<span class="ok">*** AUTHENTICATION SUCCESSFUL ***</span>

  <span class="dim">User ID.............</span> <span class="cyan">%USER_ID%</span>
  <span class="dim">Username............</span> <span class="white">%USERNAME%</span>
  <span class="dim">Status..............</span> <span class="cyan">VERIFIED</span>

<span class="amber">Account linked. You may now close this window.</span>)";

constexpr const char* kErrorSequence =
    R"(<span class="white">OAUTH AUTHENTICATION SYSTEM</span>

<span class="err">*** AUTHENTICATION FAILED ***</span>

  <span class="dim">Error Code..........</span> <span class="err">%ERROR_CODE%</span>
  <span class="dim">Fault Address.......</span> <span class="err">0x%ERROR_HEX%</span>
  <span class="dim">Description.........</span> <span class="cyan">%ERROR_MESSAGE%</span>
  <span class="dim">Timestamp...........</span> <span class="white">%TIMESTAMP%</span>

<span class="amber">Return to <a href="/" class="amber">/</a> and try again.</span>)";

constexpr const char* kCreditsBannerDesktop =
    R"(<span class="amber"> ####  ####   #####  ####   #####  #####   ####
#      #   #  #      #   #    #      #    #
#      ####   ####   #   #    #      #     ###
#      #  #   #      #   #    #      #        #
 ####  #   #  #####  ####   #####    #    ####</span>)";

constexpr const char* kCreditsBannerMobile =
    R"(<span class="amber">+---------------+
|    CREDITS    |
+---------------+</span>)";

constexpr const char* kCreditsSequence =
    R"(%BANNER%

<span class="white">SYSTEM DEVELOPED BY</span>

  <span class="yellow">THE OAUTHLINK AUTHORS</span>

<span class="dim">OAUTHLINK ACCOUNT LINK SERVICE</span>
<span class="dim">VERSION %VERSION%</span>)";

}  // namespace oauthlink::oauth
