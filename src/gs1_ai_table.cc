/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   src/gs1_ai_table.cc
 * Description: Embedded GS1 application identifier table.
 *
 * Copyright (C) 2026 Dieter J Kybelksties <github@kybelksties.com>
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 *
 * @date: 2026-10-18
 * @author: Dieter J Kybelksties
 */

#include "gs1_catalog.h"

namespace gs1
{

namespace
{

    // Row attributes follow the GS1 Barcode Syntax Dictionary:
    //   fixed  - predefined length, no separator needed after the value
    //   spec   - component list, e.g. "N14,csum" or "N3,iso4217 N..15"
    //   req/ex - companion AIs, "310n" naming the whole family
    // Codes ending in 'n' carry the implied decimal position as their last digit.
    constexpr std::string_view kEmbeddedAiTable = R"xml(<?xml version="1.0" encoding="UTF-8"?>
<gs1 type="GS1" version="24.0">
  <ais>
    <ai code="00" fixed="Y" spec="N18,csum,gcppos2" dlpkey="Y" title="SSCC"/>
    <ai code="01" fixed="Y" spec="N14,csum,gcppos2" ex="255,37" dlpkey="Y" title="GTIN"/>
    <ai code="02" fixed="Y" spec="N14,csum,gcppos2" req="37" ex="01,03" title="CONTENT"/>
    <ai code="10" spec="X..20" req="01,02,03,8006,8026" title="BATCH/LOT"/>
    <ai code="11" fixed="Y" spec="N6,yymmd0" req="01,02,03,8006,8026" title="PROD DATE"/>
    <ai code="12" fixed="Y" spec="N6,yymmd0" req="8020" title="DUE DATE"/>
    <ai code="13" fixed="Y" spec="N6,yymmd0" req="01,02,03,8006,8026" title="PACK DATE"/>
    <ai code="15" fixed="Y" spec="N6,yymmd0" req="01,02,03,8006,8026" title="BEST BEFORE or BEST BY"/>
    <ai code="16" fixed="Y" spec="N6,yymmd0" req="01,02,03,8006,8026" title="SELL BY"/>
    <ai code="17" fixed="Y" spec="N6,yymmd0" req="01,02,03,8006,8026" title="USE BY or EXPIRY"/>
    <ai code="20" fixed="Y" spec="N2" req="01,02" title="VARIANT"/>
    <ai code="21" spec="X..20" req="01,8006" title="SERIAL"/>
    <ai code="22" spec="X..20" req="01" title="CPV"/>
    <ai code="235" spec="X..28" req="01" ex="21" title="TPX"/>
    <ai code="240" spec="X..30" req="01,02" title="ADDITIONAL ID"/>
    <ai code="241" spec="X..30" req="01,02" title="CUST. PART No."/>
    <ai code="242" spec="N..6" req="01" title="MTO VARIANT"/>
    <ai code="243" spec="X..20" req="01" title="PCN"/>
    <ai code="250" spec="X..30" req="01" title="SECONDARY SERIAL"/>
    <ai code="251" spec="X..30" req="01" title="REF. TO SOURCE"/>
    <ai code="253" spec="N13,csum,key X..17" dlpkey="Y" title="GDTI"/>
    <ai code="254" spec="X..20" req="414,417" title="GLN EXTENSION COMPONENT"/>
    <ai code="255" spec="N13,csum,key N..12" ex="01,02" dlpkey="Y" title="GCN"/>
    <ai code="30" spec="N..8" req="01,02" title="VAR. COUNT"/>
    <ai code="310n" fixed="Y" spec="N6" req="01,02" ex="320n" title="NET WEIGHT (kg)"/>
    <ai code="311n" fixed="Y" spec="N6" req="01,02" ex="321n" title="LENGTH (m)"/>
    <ai code="312n" fixed="Y" spec="N6" req="01,02" ex="322n" title="WIDTH (m)"/>
    <ai code="313n" fixed="Y" spec="N6" req="01,02" ex="323n" title="HEIGHT (m)"/>
    <ai code="314n" fixed="Y" spec="N6" req="01,02" ex="324n" title="AREA (m²)"/>
    <ai code="315n" fixed="Y" spec="N6" req="01,02" ex="316n" title="NET VOLUME (l)"/>
    <ai code="316n" fixed="Y" spec="N6" req="01,02" ex="315n" title="NET VOLUME (m³)"/>
    <ai code="320n" fixed="Y" spec="N6" req="01,02" ex="310n" title="NET WEIGHT (lb)"/>
    <ai code="321n" fixed="Y" spec="N6" req="01,02" ex="311n" title="LENGTH (in)"/>
    <ai code="322n" fixed="Y" spec="N6" req="01,02" ex="312n" title="LENGTH (ft)"/>
    <ai code="323n" fixed="Y" spec="N6" req="01,02" ex="313n" title="LENGTH (yd)"/>
    <ai code="324n" fixed="Y" spec="N6" req="01,02" ex="314n" title="WIDTH (in)"/>
    <ai code="325n" fixed="Y" spec="N6" req="01,02" title="WIDTH (ft)"/>
    <ai code="326n" fixed="Y" spec="N6" req="01,02" title="WIDTH (yd)"/>
    <ai code="327n" fixed="Y" spec="N6" req="01,02" title="HEIGHT (in)"/>
    <ai code="328n" fixed="Y" spec="N6" req="01,02" title="HEIGHT (ft)"/>
    <ai code="329n" fixed="Y" spec="N6" req="01,02" title="HEIGHT (yd)"/>
    <ai code="330n" fixed="Y" spec="N6" req="00" title="GROSS WEIGHT (kg)"/>
    <ai code="331n" fixed="Y" spec="N6" req="00" title="LENGTH (m), log"/>
    <ai code="332n" fixed="Y" spec="N6" req="00" title="WIDTH (m), log"/>
    <ai code="333n" fixed="Y" spec="N6" req="00" title="HEIGHT (m), log"/>
    <ai code="334n" fixed="Y" spec="N6" req="00" title="AREA (m²), log"/>
    <ai code="335n" fixed="Y" spec="N6" req="00" title="VOLUME (l), log"/>
    <ai code="336n" fixed="Y" spec="N6" req="00" title="VOLUME (m³), log"/>
    <ai code="337n" fixed="Y" spec="N6" req="00" title="KG PER m²"/>
    <ai code="340n" fixed="Y" spec="N6" req="00" title="GROSS WEIGHT (lb)"/>
    <ai code="341n" fixed="Y" spec="N6" req="00" title="LENGTH (in), log"/>
    <ai code="342n" fixed="Y" spec="N6" req="00" title="LENGTH (ft), log"/>
    <ai code="343n" fixed="Y" spec="N6" req="00" title="LENGTH (yd), log"/>
    <ai code="344n" fixed="Y" spec="N6" req="00" title="WIDTH (in), log"/>
    <ai code="345n" fixed="Y" spec="N6" req="00" title="WIDTH (ft), log"/>
    <ai code="346n" fixed="Y" spec="N6" req="00" title="WIDTH (yd), log"/>
    <ai code="347n" fixed="Y" spec="N6" req="00" title="HEIGHT (in), log"/>
    <ai code="348n" fixed="Y" spec="N6" req="00" title="HEIGHT (ft), log"/>
    <ai code="349n" fixed="Y" spec="N6" req="00" title="HEIGHT (yd), log"/>
    <ai code="350n" fixed="Y" spec="N6" req="00" title="AREA (in²)"/>
    <ai code="351n" fixed="Y" spec="N6" req="00" title="AREA (ft²)"/>
    <ai code="352n" fixed="Y" spec="N6" req="00" title="AREA (yd²)"/>
    <ai code="353n" fixed="Y" spec="N6" req="00" title="AREA (in²), log"/>
    <ai code="354n" fixed="Y" spec="N6" req="00" title="AREA (ft²), log"/>
    <ai code="355n" fixed="Y" spec="N6" req="00" title="AREA (yd²), log"/>
    <ai code="356n" fixed="Y" spec="N6" req="01,02" title="NET WEIGHT (t oz)"/>
    <ai code="357n" fixed="Y" spec="N6" req="01,02" title="NET VOLUME (oz)"/>
    <ai code="360n" fixed="Y" spec="N6" req="00" title="NET VOLUME (q)"/>
    <ai code="361n" fixed="Y" spec="N6" req="00" title="NET VOLUME (gal)"/>
    <ai code="362n" fixed="Y" spec="N6" req="00" title="VOLUME (q), log"/>
    <ai code="363n" fixed="Y" spec="N6" req="00" title="VOLUME (gal), log"/>
    <ai code="364n" fixed="Y" spec="N6" req="00" title="VOLUME (in³)"/>
    <ai code="365n" fixed="Y" spec="N6" req="00" title="VOLUME (ft³)"/>
    <ai code="366n" fixed="Y" spec="N6" req="00" title="VOLUME (yd³)"/>
    <ai code="367n" fixed="Y" spec="N6" req="00" title="VOLUME (in³), log"/>
    <ai code="368n" fixed="Y" spec="N6" req="00" title="VOLUME (ft³), log"/>
    <ai code="369n" fixed="Y" spec="N6" req="00" title="VOLUME (yd³), log"/>
    <ai code="37" spec="N..8" req="02" title="COUNT"/>
    <ai code="390n" spec="N..15" req="8020" ex="391n,394n,8111" title="AMOUNT"/>
    <ai code="391n" spec="N3,iso4217 N..15" req="8020" ex="390n,394n,8111" title="AMOUNT"/>
    <ai code="392n" spec="N..15" req="01,02" title="PRICE"/>
    <ai code="393n" spec="N3,iso4217 N..15" req="01,02" title="PRICE"/>
    <ai code="394n" spec="N4 N..15" req="8020" ex="390n,391n,8111" title="PRCNT OFF"/>
    <ai code="395n" spec="N6" req="01,02" title="PRICE/UoM"/>
    <ai code="400" spec="X..30" title="ORDER NUMBER"/>
    <ai code="401" spec="X..30,csumalpha,key" dlpkey="Y" title="GINC"/>
    <ai code="402" spec="N17,csum,key" dlpkey="Y" title="GSIN"/>
    <ai code="403" spec="X..30" req="00" title="ROUTE"/>
    <ai code="410" fixed="Y" spec="N13,csum,key" title="SHIP TO LOC"/>
    <ai code="411" fixed="Y" spec="N13,csum,key" title="BILL TO"/>
    <ai code="412" fixed="Y" spec="N13,csum,key" title="PURCHASE FROM"/>
    <ai code="413" fixed="Y" spec="N13,csum,key" title="SHIP FOR LOC"/>
    <ai code="414" fixed="Y" spec="N13,csum,key" dlpkey="Y" title="LOC No."/>
    <ai code="415" fixed="Y" spec="N13,csum,key" dlpkey="Y" title="PAY TO"/>
    <ai code="416" fixed="Y" spec="N13,csum,key" title="PROD/SERV LOC"/>
    <ai code="417" fixed="Y" spec="N13,csum,key" dlpkey="Y" title="PARTY"/>
    <ai code="420" spec="X..20" title="SHIP TO POST"/>
    <ai code="421" spec="N3,iso3166 X..9" title="SHIP TO POST"/>
    <ai code="422" fixed="Y" spec="N3,iso3166" req="01,02" title="ORIGIN"/>
    <ai code="423" spec="N..15,iso3166list" req="01,02" title="COUNTRY - INITIAL PROCESS"/>
    <ai code="424" fixed="Y" spec="N3,iso3166" req="01,02" title="COUNTRY - PROCESS"/>
    <ai code="425" spec="N..15,iso3166list" req="01,02" title="COUNTRY - DISASSEMBLY"/>
    <ai code="426" fixed="Y" spec="N3,iso3166" req="01,02" title="COUNTRY - FULL PROCESS"/>
    <ai code="427" spec="X..3" req="01,02" title="ORIGIN SUBDIVISION"/>
    <ai code="4300" spec="X..35,pcenc" title="SHIP TO COMP"/>
    <ai code="4301" spec="X..35,pcenc" title="SHIP TO NAME"/>
    <ai code="4302" spec="X..70,pcenc" title="SHIP TO ADD1"/>
    <ai code="4303" spec="X..70,pcenc" title="SHIP TO ADD2"/>
    <ai code="4304" spec="X..70,pcenc" title="SHIP TO SUB"/>
    <ai code="4305" spec="X..70,pcenc" title="SHIP TO LOC"/>
    <ai code="4306" spec="X..70,pcenc" title="SHIP TO REG"/>
    <ai code="4307" spec="X2,iso3166alpha2" title="SHIP TO COUNTRY"/>
    <ai code="4308" spec="X..30" title="SHIP TO PHONE"/>
    <ai code="4309" spec="N20,latlong" title="SHIP TO GEO"/>
    <ai code="4310" spec="X..35,pcenc" title="RTN TO COMP"/>
    <ai code="4311" spec="X..35,pcenc" title="RTN TO NAME"/>
    <ai code="4312" spec="X..70,pcenc" title="RTN TO ADD1"/>
    <ai code="4313" spec="X..70,pcenc" title="RTN TO ADD2"/>
    <ai code="4314" spec="X..70,pcenc" title="RTN TO SUB"/>
    <ai code="4315" spec="X..70,pcenc" title="RTN TO LOC"/>
    <ai code="4316" spec="X..70,pcenc" title="RTN TO REG"/>
    <ai code="4317" spec="X2,iso3166alpha2" title="RTN TO COUNTRY"/>
    <ai code="4318" spec="X..30" title="RTN TO POST"/>
    <ai code="4319" spec="X..30" title="RTN TO PHONE"/>
    <ai code="4320" spec="X..35,pcenc" title="SRV DESCRIPTION"/>
    <ai code="4321" spec="N1,yesno" title="DANGEROUS GOODS"/>
    <ai code="4322" spec="N1,yesno" title="AUTH LEAVE"/>
    <ai code="4323" spec="N1,yesno" title="SIG REQUIRED"/>
    <ai code="4324" spec="N10,yymmddhh" title="NBEF DEL DT"/>
    <ai code="4325" spec="N10,yymmddhh" title="NAFT DEL DT"/>
    <ai code="4326" spec="N6,yymmdd" title="REL DATE"/>
    <ai code="4330" spec="X..35,pcenc" req="01,02" title="MAX TEMP (F)"/>
    <ai code="4331" spec="X..35,pcenc" req="01,02" title="MAX TEMP (C)"/>
    <ai code="4332" spec="X..35,pcenc" req="01,02" title="MIN TEMP (F)"/>
    <ai code="4333" spec="X..35,pcenc" req="01,02" title="MIN TEMP (C)"/>
    <ai code="7001" fixed="Y" spec="N13" req="01,02" title="NSN"/>
    <ai code="7002" spec="X..30" req="01,02" title="MEAT CUT"/>
    <ai code="7003" fixed="Y" spec="N10,yymmddhh" req="01,02" title="EXPIRY TIME"/>
    <ai code="7004" spec="N..4" req="01,02" title="ACTIVE POTENCY"/>
    <ai code="7005" spec="X..12" req="01,02" title="CATCH AREA"/>
    <ai code="7006" fixed="Y" spec="N6,yymmdd" req="01,02" title="FIRST FREEZE DATE"/>
    <ai code="7007" spec="N6,yymmdd N..6,yymmdd" req="01,02" title="HARVEST DATE"/>
    <ai code="7008" spec="X..3" req="01,02" title="AQUATIC SPECIES"/>
    <ai code="7009" spec="X..10" req="01,02" title="FISHING GEAR TYPE"/>
    <ai code="7010" spec="X..2" req="01,02" title="PROD METHOD"/>
    <ai code="7011" spec="N6,yymmdd N..4,hhmm" req="01,02" title="TEST BY DATE"/>
    <ai code="7020" spec="X..20" req="01,414" title="REFURB LOT"/>
    <ai code="7021" spec="X..20" req="01" title="FUNC STAT"/>
    <ai code="7022" spec="X..20" req="01" title="REV STAT"/>
    <ai code="7023" spec="X..30" req="00,01" title="GIAI - ASSEMBLY"/>
    <ai code="7030" spec="N3,iso3166999 X..27" req="01" title="PROCESSOR # 0"/>
    <ai code="7031" spec="N3,iso3166999 X..27" req="01" title="PROCESSOR # 1"/>
    <ai code="7032" spec="N3,iso3166999 X..27" req="01" title="PROCESSOR # 2"/>
    <ai code="7033" spec="N3,iso3166999 X..27" req="01" title="PROCESSOR # 3"/>
    <ai code="7034" spec="N3,iso3166999 X..27" req="01" title="PROCESSOR # 4"/>
    <ai code="7035" spec="N3,iso3166999 X..27" req="01" title="PROCESSOR # 5"/>
    <ai code="7036" spec="N3,iso3166999 X..27" req="01" title="PROCESSOR # 6"/>
    <ai code="7037" spec="N3,iso3166999 X..27" req="01" title="PROCESSOR # 7"/>
    <ai code="7038" spec="N3,iso3166999 X..27" req="01" title="PROCESSOR # 8"/>
    <ai code="7039" spec="N3,iso3166999 X..27" req="01" title="PROCESSOR # 9"/>
    <ai code="7040" spec="N1 X1 X1 X1,importeridx" req="417" title="UIC+EXT"/>
    <ai code="710" spec="X..20" req="01" title="NHRN PZN"/>
    <ai code="711" spec="X..20" req="01" title="NHRN CIP"/>
    <ai code="712" spec="X..20" req="01" title="NHRN CN"/>
    <ai code="713" spec="X..20" req="01" title="NHRN DRN"/>
    <ai code="714" spec="X..20" req="01" title="NHRN AIM"/>
    <ai code="715" spec="X..20" req="01" title="NHRN NDC"/>
    <ai code="716" spec="X..20" req="01" title="NHRN AIC"/>
    <ai code="717" spec="X..20" req="01" title="NHRN SRN"/>
    <ai code="7230" spec="X2 X..28" req="01,8004" title="CERT # 1"/>
    <ai code="7231" spec="X2 X..28" req="01,8004" title="CERT # 2"/>
    <ai code="7232" spec="X2 X..28" req="01,8004" title="CERT # 3"/>
    <ai code="7233" spec="X2 X..28" req="01,8004" title="CERT # 4"/>
    <ai code="7234" spec="X2 X..28" req="01,8004" title="CERT # 5"/>
    <ai code="7235" spec="X2 X..28" req="01,8004" title="CERT # 6"/>
    <ai code="7236" spec="X2 X..28" req="01,8004" title="CERT # 7"/>
    <ai code="7237" spec="X2 X..28" req="01,8004" title="CERT # 8"/>
    <ai code="7238" spec="X2 X..28" req="01,8004" title="CERT # 9"/>
    <ai code="7239" spec="X2 X..28" req="01,8004" title="CERT # 10"/>
    <ai code="7240" spec="X..20" req="01" title="PROTOCOL"/>
    <ai code="7241" spec="N2,mediatype" req="8017,8018" title="AIDC MEDIA TYPE"/>
    <ai code="7242" spec="X..25" req="8017,8018" title="VCN"/>
    <ai code="8001" fixed="Y" spec="N14" req="01" title="DIMENSIONS"/>
    <ai code="8002" spec="X..20" req="01" title="CMT No."/>
    <ai code="8003" spec="N1 N13,csum,key X..16" dlpkey="Y" title="GRAI"/>
    <ai code="8004" spec="X..30,key" dlpkey="Y" title="GIAI"/>
    <ai code="8005" fixed="Y" spec="N6" req="01,02" title="PRICE PER UNIT"/>
    <ai code="8006" fixed="Y" spec="N14,csum,gcppos2 N2 N2" dlpkey="Y" title="ITIP"/>
    <ai code="8007" spec="X..34,iban" title="IBAN"/>
    <ai code="8008" spec="N8,yymmddhh N..4,mmoptss" req="01,02" title="PROD TIME"/>
    <ai code="8009" spec="X..50" req="01" title="OPTSEN"/>
    <ai code="8010" spec="Y..30,key" dlpkey="Y" title="CPID"/>
    <ai code="8011" spec="N..12,nozeroprefix" req="8010" title="CPID SERIAL"/>
    <ai code="8012" spec="X..20" req="01" title="VERSION"/>
    <ai code="8013" spec="X..25,csumalpha,key" dlpkey="Y" title="GMN"/>
    <ai code="8017" fixed="Y" spec="N18,csum,key" ex="8018" dlpkey="Y" title="GSRN - PROVIDER"/>
    <ai code="8018" fixed="Y" spec="N18,csum,key" ex="8017" dlpkey="Y" title="GSRN - RECIPIENT"/>
    <ai code="8019" spec="N..10" req="8017,8018" title="SRIN"/>
    <ai code="8020" spec="X..25" req="415" title="REF No."/>
    <ai code="8026" fixed="Y" spec="N14,csum,gcppos2 N2 N2" dlpkey="Y" title="ITIP CONTENT"/>
    <ai code="8030" spec="X..90" title="DIGSIG"/>
    <ai code="8110" spec="X..70,couponcode" title="COUPON CODE"/>
    <ai code="8111" fixed="Y" spec="N4" req="255" ex="390n,391n,394n" title="POINTS"/>
    <ai code="8112" spec="X..70,couponposoffer" title="COUPON OFFER"/>
    <ai code="8200" spec="X..70" req="01" title="PRODUCT URL"/>
    <ai code="90" spec="X..30" title="INTERNAL"/>
    <ai code="91-99" spec="X..90" title="INTERNAL"/>
  </ais>
</gs1>
)xml";

}  // namespace

std::string_view Catalog::embeddedTable()
{
    return kEmbeddedAiTable;
}

}  // namespace gs1
